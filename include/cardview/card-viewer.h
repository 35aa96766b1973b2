#pragma once

#include <cardview/animation-scheduler.h>
#include <cardview/base/event-listener.h>
#include <cardview/base/event-loop.h>
#include <cardview/base/factory.h>
#include <cardview/presence-machine.h>
#include <cardview/render-composer.h>
#include <cardview/transport-client.h>
#include <cardview/viewer-settings.h>
#include <string_view>

namespace cardview {

//=============================================================================
// CardViewer - wires the pipeline together on one event loop:
//
//   TransportClient -> CardDecoder -> PresenceMachine -> AnimationScheduler
//                                                            -> RenderComposer
//
// Frames arrive as Event::FrameReceived and are applied in arrival order; the
// animation timer ticks the scheduler. Both run on the loop thread, so a
// frame that arrives between two ticks is fully applied before the next one.
//=============================================================================
class CardViewer : public base::EventListener,
                   public base::ObjectFactory<CardViewer> {
public:
    using Ptr = std::shared_ptr<CardViewer>;

    struct Stats {
        uint64_t framesAccepted = 0;
        uint64_t schemaErrors = 0;
        uint64_t commands = 0;
        uint64_t renders = 0;
        uint64_t invariantViolations = 0;
    };

    static Result<Ptr> createImpl(base::EventLoop::Ptr loop,
                                  const ViewerSettings& settings,
                                  RenderComposer::Ptr composer,
                                  InvariantSink invariantSink = {}) noexcept;

    ~CardViewer() override = default;

    // Connect and start the animation timer
    virtual Result<void> start() = 0;
    virtual Result<void> stop() = 0;

    // Decode and apply one frame as if it came off the wire
    virtual void handleFrame(std::string_view frame) = 0;

    // Advance the animation by dtMs and render
    virtual void tick(uint64_t dtMs) = 0;

    virtual const PresenceMachine& presence() const = 0;
    virtual const AnimationScheduler& scheduler() const = 0;
    virtual const ViewerSettings& settings() const = 0;
    virtual TransportClient::Health connectionHealth() const = 0;
    virtual Stats stats() const = 0;

protected:
    CardViewer() = default;
};

} // namespace cardview
