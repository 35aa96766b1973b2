#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace cardview {
namespace base {

struct Event {
    enum class Type {
        None,
        // Timer
        Timer,
        // One complete wire frame from the transport (payload: std::string)
        FrameReceived,
        // Transport health change
        ConnectionChanged
    };

    struct TimerEvent {
        int timerId;
    };

    struct ConnectionEvent {
        uint8_t health;    // TransportClient::Health
        uint32_t attempt;  // connect attempts since the last success
    };

    Type type = Type::None;

    union {
        TimerEvent timer;
        ConnectionEvent connection;
    };

    // Optional heap-allocated payload, freed when the event goes out of scope.
    // Handlers cast via std::static_pointer_cast<T>(event.payload).
    std::shared_ptr<void> payload;

    Event() : timer{0} {}

    // Factory methods
    static Event timerEvent(int timerId) {
        Event e;
        e.type = Type::Timer;
        e.timer = {timerId};
        return e;
    }

    static Event frameEvent(std::string frame) {
        Event e;
        e.type = Type::FrameReceived;
        e.payload = std::make_shared<std::string>(std::move(frame));
        return e;
    }

    static Event connectionEvent(uint8_t health, uint32_t attempt) {
        Event e;
        e.type = Type::ConnectionChanged;
        e.connection = {health, attempt};
        return e;
    }

    // Frame text of a FrameReceived event, empty for any other type
    const std::string& frame() const {
        static const std::string empty;
        if (type != Type::FrameReceived || !payload) return empty;
        return *std::static_pointer_cast<std::string>(payload);
    }
};

} // namespace base
} // namespace cardview
