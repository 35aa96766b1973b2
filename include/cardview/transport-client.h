#pragma once

#include <cardview/base/event-loop.h>
#include <cardview/base/event-listener.h>
#include <cardview/base/factory.h>
#include <cardview/result.hpp>
#include <cstdint>
#include <string>

namespace cardview {

struct TransportSettings {
    std::string host = "127.0.0.1";
    uint16_t port = 41112;
    uint64_t backoffInitialMs = 1000;
    uint64_t backoffMaxMs = 30000;
    size_t maxFrameBytes = 16 * 1024 * 1024;
    // Write "ACK\n" after every complete frame
    bool ack = false;
};

//=============================================================================
// TransportClient - persistent TCP connection to the card event source.
//
// Complete newline-delimited frames are dispatched on the event loop as
// Event::FrameReceived; health changes as Event::ConnectionChanged.
// Connect failures and disconnects are retried forever with exponential
// backoff. A partially received frame is dropped when the connection goes.
//=============================================================================
class TransportClient : public base::EventListener,
                        public base::ObjectFactory<TransportClient> {
public:
    using Ptr = std::shared_ptr<TransportClient>;

    enum class Health : uint8_t {
        Disconnected,  // not started, or stopped
        Connecting,    // first attempt in progress
        Connected,
        Reconnecting   // a previous attempt failed or the connection dropped
    };

    static Result<Ptr> createImpl(base::EventLoop::Ptr loop, const TransportSettings& settings) noexcept;

    ~TransportClient() override = default;

    // Begin connecting; returns immediately
    virtual Result<void> start() = 0;

    // Close the connection and cancel any pending retry
    virtual void stop() = 0;

    virtual Health health() const = 0;
    virtual const TransportSettings& settings() const = 0;

    // Attempts since the last successful connect
    virtual uint32_t attempt() const = 0;

    virtual uint64_t framesReceived() const = 0;
    virtual uint64_t framesDropped() const = 0;

protected:
    TransportClient() = default;
};

const char* healthName(TransportClient::Health health);

} // namespace cardview
