#pragma once

#include "factory.h"
#include "event.h"
#include "event-listener.h"

#include <cstdint>

struct uv_loop_s;
typedef struct uv_loop_s uv_loop_t;

namespace cardview {
namespace base {

using TimerId = int;
using Timeout = int;

// libuv-backed event loop. Each instance owns its own uv_loop_t; components
// that need it receive the Ptr explicitly. Everything registered here runs
// on the thread that calls start()/runOnce().
class EventLoop : public ObjectFactory<EventLoop> {
public:
    using Ptr = std::shared_ptr<EventLoop>;

    static Result<Ptr> createImpl() noexcept;

    virtual ~EventLoop() = default;

    // Run until stop() (blocking). Returns the uv_run() result.
    virtual int start() = 0;

    // Stop the event loop
    virtual Result<void> stop() = 0;

    // Process pending callbacks, blocking for at most one round of I/O
    virtual bool runOnce() = 0;

    // Process whatever is ready without blocking
    virtual bool runNoWait() = 0;

    // Loop clock in milliseconds (monotonic, updated once per iteration)
    virtual uint64_t now() const = 0;

    virtual uv_loop_t* uvLoop() const = 0;

    // Event listener registration by type
    // priority: higher value = called first (default 0)
    virtual Result<void> registerListener(Event::Type type, EventListener::Ptr listener, int priority = 0) = 0;

    virtual Result<bool> dispatch(const Event& event) = 0;

    // Timer management
    virtual Result<TimerId> createTimer() = 0;
    virtual Result<void> configTimer(TimerId id, Timeout timeoutMs) = 0;
    virtual Result<void> startTimer(TimerId id) = 0;
    virtual Result<void> stopTimer(TimerId id) = 0;
    virtual Result<void> destroyTimer(TimerId id) = 0;
    virtual Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) = 0;

protected:
    EventLoop() = default;
};

} // namespace base
} // namespace cardview
