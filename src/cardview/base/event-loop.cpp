#include <cardview/base/event-loop.h>
#include <ytrace/ytrace.hpp>
#include <vector>
#include <unordered_map>
#include <algorithm>
#include <uv.h>

namespace cardview {
namespace base {

struct EventTypeHash {
    std::size_t operator()(Event::Type t) const noexcept {
        return static_cast<std::size_t>(t);
    }
};

struct TimerHandle {
    uv_timer_t timer;
    int id = -1;
    Timeout timeout = 0;
    std::vector<std::weak_ptr<EventListener>> listeners;
};

class EventLoopImpl : public EventLoop {
public:
    EventLoopImpl() = default;

    ~EventLoopImpl() override {
        if (!_initialized) return;

        for (auto& [id, th] : _timers) {
            uv_timer_stop(&th->timer);
            uv_close(reinterpret_cast<uv_handle_t*>(&th->timer), nullptr);
        }

        // Close whatever other components left open, then drain close callbacks
        uv_walk(&_loop, [](uv_handle_t* handle, void*) {
            if (!uv_is_closing(handle)) {
                uv_close(handle, nullptr);
            }
        }, nullptr);
        uv_run(&_loop, UV_RUN_DEFAULT);
        _timers.clear();

        int r = uv_loop_close(&_loop);
        if (r != 0) {
            ywarn("EventLoop: uv_loop_close failed: {}", uv_strerror(r));
        }
    }

    Result<void> init() noexcept {
        int r = uv_loop_init(&_loop);
        if (r != 0) {
            return Err<void>(std::string("uv_loop_init failed: ") + uv_strerror(r));
        }
        _initialized = true;
        return Ok();
    }

    int start() override {
        yinfo("EventLoop::start: running loop");
        return uv_run(&_loop, UV_RUN_DEFAULT);
    }

    Result<void> stop() override {
        yinfo("EventLoop::stop");
        uv_stop(&_loop);
        return Ok();
    }

    bool runOnce() override {
        return uv_run(&_loop, UV_RUN_ONCE) != 0;
    }

    bool runNoWait() override {
        return uv_run(&_loop, UV_RUN_NOWAIT) != 0;
    }

    uint64_t now() const override {
        return uv_now(&_loop);
    }

    uv_loop_t* uvLoop() const override {
        return const_cast<uv_loop_t*>(&_loop);
    }

    Result<void> registerListener(Event::Type type, EventListener::Ptr listener, int priority = 0) override {
        if (!listener) {
            return Err<void>("EventLoop::registerListener: null listener");
        }
        auto& vec = _listeners[type];
        // Insert sorted by priority (descending - higher priority first)
        PrioritizedListener entry{listener, priority};
        auto insertPos = std::lower_bound(vec.begin(), vec.end(), entry,
            [](const PrioritizedListener& a, const PrioritizedListener& b) {
                return a.priority > b.priority;
            });
        vec.insert(insertPos, entry);
        return Ok();
    }

    Result<bool> dispatch(const Event& event) override {
        auto it = _listeners.find(event.type);
        if (it == _listeners.end()) return Ok(false);

        auto listeners = it->second;  // copy for safe iteration
        for (const auto& pl : listeners) {
            if (auto sp = pl.listener.lock()) {
                auto result = sp->onEvent(event);
                if (!result) {
                    return Err<bool>("Event handler failed", result);
                }
                if (*result) {
                    return Ok(true);  // consumed by higher priority listener
                }
            }
        }
        return Ok(false);
    }

    Result<TimerId> createTimer() override {
        TimerId id = _nextTimerId++;
        auto th = std::make_unique<TimerHandle>();
        th->id = id;
        int r = uv_timer_init(&_loop, &th->timer);
        if (r != 0) {
            return Err<TimerId>(std::string("uv_timer_init failed: ") + uv_strerror(r));
        }
        th->timer.data = th.get();
        _timers[id] = std::move(th);
        ydebug("EventLoop::createTimer: id={}", id);
        return Ok(id);
    }

    Result<void> configTimer(TimerId id, Timeout timeoutMs) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }
        if (timeoutMs <= 0) {
            return Err<void>("Timer timeout must be positive");
        }

        auto& th = it->second;
        th->timeout = timeoutMs;
        // Restart timer if it's already running
        if (uv_is_active(reinterpret_cast<uv_handle_t*>(&th->timer))) {
            uv_timer_start(&th->timer, onTimerCallback, timeoutMs, timeoutMs);
        }
        ydebug("EventLoop::configTimer: id={} timeout={}", id, timeoutMs);
        return Ok();
    }

    Result<void> startTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }

        auto& th = it->second;
        if (th->timeout <= 0) {
            return Err<void>("Timer not configured");
        }
        ydebug("EventLoop::startTimer: id={} timeout={}", id, th->timeout);
        int r = uv_timer_start(&th->timer, onTimerCallback, th->timeout, th->timeout);
        if (r != 0) {
            return Err<void>(std::string("uv_timer_start failed: ") + uv_strerror(r));
        }
        return Ok();
    }

    Result<void> stopTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }

        uv_timer_stop(&it->second->timer);
        return Ok();
    }

    Result<void> destroyTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }

        // The handle memory must outlive uv_close; hand it to the close callback
        TimerHandle* th = it->second.release();
        _timers.erase(it);
        uv_timer_stop(&th->timer);
        uv_close(reinterpret_cast<uv_handle_t*>(&th->timer), [](uv_handle_t* h) {
            delete static_cast<TimerHandle*>(h->data);
        });
        return Ok();
    }

    Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }

        ydebug("EventLoop::registerTimerListener: id={} listener={}", id, (void*)listener.get());
        it->second->listeners.push_back(listener);
        return Ok();
    }

private:
    static void onTimerCallback(uv_timer_t* handle) {
        auto* th = static_cast<TimerHandle*>(handle->data);

        Event event = Event::timerEvent(th->id);

        auto listeners = th->listeners;  // a listener may destroy this timer
        for (const auto& wp : listeners) {
            if (auto sp = wp.lock()) {
                if (auto res = sp->onEvent(event); !res) {
                    yerror("EventLoop: timer {} listener failed: {}", event.timer.timerId, error_msg(res));
                }
            }
        }
    }

    struct PrioritizedListener {
        std::weak_ptr<EventListener> listener;
        int priority;
    };

    std::unordered_map<Event::Type, std::vector<PrioritizedListener>, EventTypeHash> _listeners;

    uv_loop_t _loop{};
    bool _initialized = false;
    std::unordered_map<TimerId, std::unique_ptr<TimerHandle>> _timers;
    TimerId _nextTimerId = 1;
};

// Factory implementation
Result<EventLoop::Ptr> EventLoop::createImpl() noexcept {
    auto impl = std::make_shared<EventLoopImpl>();
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to init EventLoop", res);
    }
    return Ok<Ptr>(impl);
}

} // namespace base
} // namespace cardview
