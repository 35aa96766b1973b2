//=============================================================================
// EventLoop / Object Tests
//
// Factory creation, prioritized dispatch, repeating timers and the shutdown
// guard that CardViewer and TransportClient rely on.
//=============================================================================

#include <boost/ut.hpp>
#include <cardview/base/event-loop.h>
#include <chrono>
#include <thread>
#include <vector>

using namespace boost::ut;
using namespace cardview;
using namespace cardview::base;

namespace {

// Appends its tag to a shared log; optionally consumes the event
class TaggedListener : public EventListener {
public:
    TaggedListener(std::vector<int>& log, int tag, bool consume = false)
        : _log(log), _tag(tag), _consume(consume) {}

    Result<bool> onEvent(const Event&) override {
        _log.push_back(_tag);
        return Ok(_consume);
    }

    int shutdowns = 0;

protected:
    Result<void> onShutdown() override {
        ++shutdowns;
        return Ok();
    }

private:
    std::vector<int>& _log;
    int _tag;
    bool _consume;
};

class FailingListener : public EventListener {
public:
    Result<bool> onEvent(const Event&) override {
        return Err<bool>("listener failed");
    }
};

} // namespace

suite event_loop_tests = [] {
    "create goes through createImpl and init"_test = [] {
        auto loop = EventLoop::create();
        expect((loop.has_value()) >> fatal);
        expect(*loop != nullptr);
        expect((*loop)->uvLoop() != nullptr);
    };

    "higher priority listeners run first"_test = [] {
        auto loop = EventLoop::create();
        expect((loop.has_value()) >> fatal);
        std::vector<int> log;
        auto low = std::make_shared<TaggedListener>(log, 1);
        auto high = std::make_shared<TaggedListener>(log, 2);
        expect((*loop)->registerListener(Event::Type::FrameReceived, low, 0).has_value());
        expect((*loop)->registerListener(Event::Type::FrameReceived, high, 10).has_value());

        auto res = (*loop)->dispatch(Event::frameEvent("x"));
        expect((res.has_value()) >> fatal);
        expect(!*res);
        expect(log == std::vector<int>{2, 1});
    };

    "a consuming listener stops the dispatch"_test = [] {
        auto loop = EventLoop::create();
        expect((loop.has_value()) >> fatal);
        std::vector<int> log;
        auto first = std::make_shared<TaggedListener>(log, 1, true);
        auto second = std::make_shared<TaggedListener>(log, 2);
        expect((*loop)->registerListener(Event::Type::ConnectionChanged, first, 5).has_value());
        expect((*loop)->registerListener(Event::Type::ConnectionChanged, second, 0).has_value());

        auto res = (*loop)->dispatch(Event::connectionEvent(2, 0));
        expect((res.has_value()) >> fatal);
        expect(*res);
        expect(log == std::vector<int>{1});
    };

    "expired listeners are skipped"_test = [] {
        auto loop = EventLoop::create();
        expect((loop.has_value()) >> fatal);
        std::vector<int> log;
        auto kept = std::make_shared<TaggedListener>(log, 1);
        {
            auto gone = std::make_shared<TaggedListener>(log, 2);
            expect((*loop)->registerListener(Event::Type::FrameReceived, gone, 1).has_value());
        }
        expect((*loop)->registerListener(Event::Type::FrameReceived, kept).has_value());
        auto res = (*loop)->dispatch(Event::frameEvent("x"));
        expect(res.has_value());
        expect(log == std::vector<int>{1});
    };

    "handler errors propagate with the cause"_test = [] {
        auto loop = EventLoop::create();
        expect((loop.has_value()) >> fatal);
        auto failing = std::make_shared<FailingListener>();
        expect((*loop)->registerListener(Event::Type::FrameReceived, failing).has_value());
        auto res = (*loop)->dispatch(Event::frameEvent("x"));
        expect((!res.has_value()) >> fatal);
        expect(error_msg(res).find("listener failed") != std::string::npos);
    };

    "null listener is rejected"_test = [] {
        auto loop = EventLoop::create();
        expect((loop.has_value()) >> fatal);
        expect(!(*loop)->registerListener(Event::Type::Timer, nullptr).has_value());
    };

    "repeating timer fires its listener"_test = [] {
        auto loop = EventLoop::create();
        expect((loop.has_value()) >> fatal);
        std::vector<int> log;
        auto listener = std::make_shared<TaggedListener>(log, 7);
        auto id = (*loop)->createTimer();
        expect((id.has_value()) >> fatal);
        expect((*loop)->configTimer(*id, 2).has_value());
        expect((*loop)->registerTimerListener(*id, listener).has_value());
        expect((*loop)->startTimer(*id).has_value());

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (log.size() < 3 && std::chrono::steady_clock::now() < deadline) {
            (*loop)->runNoWait();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        expect(log.size() >= 3_u);
        expect((*loop)->stopTimer(*id).has_value());
        expect((*loop)->destroyTimer(*id).has_value());
        expect(!(*loop)->startTimer(*id).has_value()) << "destroyed timer is gone";
    };

    "timer configuration is validated"_test = [] {
        auto loop = EventLoop::create();
        expect((loop.has_value()) >> fatal);
        expect(!(*loop)->configTimer(42, 10).has_value());
        auto id = (*loop)->createTimer();
        expect((id.has_value()) >> fatal);
        expect(!(*loop)->configTimer(*id, 0).has_value());
        expect(!(*loop)->startTimer(*id).has_value()) << "not configured";
    };

    "shutdown runs onShutdown once"_test = [] {
        std::vector<int> log;
        auto listener = std::make_shared<TaggedListener>(log, 1);
        expect(listener->shutdown().has_value());
        expect(listener->shutdown().has_value());
        expect(listener->shutdowns == 1_i);
        expect(listener->sharedAs<EventListener>() == listener);
    };
};
