#pragma once

#include <cardview/style-config.h>
#include <cardview/transition.h>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cardview {

//=============================================================================
// RenderFrame - immutable snapshot handed to a composer once per tick
//=============================================================================
struct RenderFrame {
    uint64_t index = 0;
    TransitionState transition;
    double eased = 0.0;
    std::shared_ptr<const StyleConfig> style;

    const CardData::Ptr& card() const { return transition.activeCard; }
    Phase phase() const { return transition.phase; }
};

// How much of the card is shown: 0 hidden, 1 fully visible
double visibility(const RenderFrame& frame);

//=============================================================================
// RenderComposer - consumer side of the render contract.
//
// render() is called on the loop thread for every tick and must return
// without waiting on drawing.
//=============================================================================
class RenderComposer {
public:
    using Ptr = std::shared_ptr<RenderComposer>;

    virtual ~RenderComposer() = default;

    virtual void render(const RenderFrame& frame) = 0;
};

//=============================================================================
// FrameMailbox - single-slot hand-off to a render thread.
//
// The newest frame overwrites an untaken one; overwritten frames are
// counted as coalesced. take()/waitAndTake() may run on another thread.
//=============================================================================
class FrameMailbox : public RenderComposer {
public:
    void render(const RenderFrame& frame) override;

    std::optional<RenderFrame> take();
    std::optional<RenderFrame> waitAndTake(std::chrono::milliseconds timeout);

    uint64_t posted() const;
    uint64_t coalesced() const;

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::optional<RenderFrame> _slot;
    uint64_t _posted = 0;
    uint64_t _coalesced = 0;
};

//=============================================================================
// LogComposer - headless composer; logs phase changes only
//=============================================================================
class LogComposer : public RenderComposer {
public:
    void render(const RenderFrame& frame) override;

    uint64_t frames() const { return _frames; }
    uint64_t phaseChanges() const { return _phaseChanges; }

private:
    std::optional<Phase> _lastPhase;
    std::string _lastCardId;
    uint64_t _frames = 0;
    uint64_t _phaseChanges = 0;
};

} // namespace cardview
