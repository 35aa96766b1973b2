//=============================================================================
// CardViewer Tests
//
// Frames in, render frames out. Drives the viewer through handleFrame() and
// tick() and through loop dispatch, without a network connection.
//=============================================================================

#include <boost/ut.hpp>
#include <cardview/card-viewer.h>
#include <ytrace/ytrace.hpp>
#include "fixtures.h"
#include <vector>

using namespace boost::ut;
using namespace cardview;

namespace {

// Keeps every frame instead of only the newest one
class RecordingComposer : public RenderComposer {
public:
    void render(const RenderFrame& frame) override { frames.push_back(frame); }

    std::vector<RenderFrame> frames;
};

ViewerSettings testSettings(bool clearOnDisconnect = false) {
    ViewerSettings s;
    s.transport.port = 41112;
    s.timing.tickMs = 10;
    s.timing.enterMs = 100;
    s.timing.swapMs = 50;
    s.timing.exitMs = 80;
    s.timing.easing = Easing::Linear;
    s.presence.clearOnDisconnect = clearOnDisconnect;
    s.style.limitations.edition = true;
    return s;
}

struct Harness {
    base::EventLoop::Ptr loop;
    std::shared_ptr<RecordingComposer> composer = std::make_shared<RecordingComposer>();
    CardViewer::Ptr viewer;
    std::vector<InvariantViolation> violations;

    explicit Harness(const ViewerSettings& settings = testSettings()) {
        auto loopRes = base::EventLoop::create();
        if (!loopRes) return;
        loop = *loopRes;
        auto viewerRes = CardViewer::create(loop, settings, composer,
            [this](const InvariantViolation& v) { violations.push_back(v); });
        if (viewerRes) viewer = *viewerRes;
    }

    ~Harness() {
        if (viewer) {
            if (auto res = viewer->shutdown(); !res) {
                ywarn("test viewer shutdown: {}", error_msg(res));
            }
        }
        viewer.reset();
        loop.reset();
    }

    void ticks(int n, uint64_t dtMs = 10) {
        for (int i = 0; i < n; ++i) viewer->tick(dtMs);
    }

    const TransitionState& state() const { return viewer->scheduler().state(); }
};

} // namespace

suite card_viewer_tests = [] {
    "create fails without a loop"_test = [] {
        auto res = CardViewer::create(nullptr, testSettings(), std::make_shared<RecordingComposer>());
        expect(!res.has_value());
    };

    "scan frame starts an enter"_test = [] {
        Harness h;
        expect((h.viewer != nullptr) >> fatal);
        h.viewer->handleFrame(test::scanFrame("46986414"));
        expect(h.viewer->presence().hasCard());
        expect(h.state().phase == Phase::EnteringCard);
        expect(h.state().activeCard->id == "46986414");
        expect(h.viewer->stats().framesAccepted == 1_u);
        expect(h.viewer->stats().commands == 1_u);
    };

    "every tick reaches the composer with the style attached"_test = [] {
        Harness h;
        expect((h.viewer != nullptr) >> fatal);
        h.viewer->handleFrame(test::scanFrame("A"));
        h.ticks(3);
        expect((h.composer->frames.size() == 3_u) >> fatal);
        for (uint64_t i = 0; i < 3; ++i) {
            const auto& f = h.composer->frames[i];
            expect(f.index == i);
            expect(f.card()->id == "A");
            expect((f.style != nullptr) >> fatal);
            expect(f.style->limitations.edition);
        }
        expect(h.composer->frames[2].eased == 0.3_d);
    };

    "malformed frames leave the state untouched"_test = [] {
        Harness h;
        expect((h.viewer != nullptr) >> fatal);
        h.viewer->handleFrame(test::scanFrame("A"));
        h.ticks(4);
        auto before = h.state();
        auto shown = h.viewer->presence().card();
        expect((shown != nullptr) >> fatal);

        h.viewer->handleFrame("{not json");
        h.viewer->handleFrame(R"({"status":"NewCard"})");
        h.viewer->handleFrame(R"({"card_data":{"id":1}})");

        expect(h.state().phase == before.phase);
        expect(h.state().progress == before.progress);
        expect(h.state().activeCard == before.activeCard);
        expect(h.viewer->presence().card() == shown);
        expect(h.viewer->presence().hasCard());
        expect(h.viewer->stats().schemaErrors == 3_u);
        expect(h.viewer->stats().framesAccepted == 1_u);
    };

    "A, A, B, removed"_test = [] {
        Harness h;
        expect((h.viewer != nullptr) >> fatal);

        h.viewer->handleFrame(test::scanFrame("A"));
        h.ticks(3);
        h.viewer->handleFrame(test::scanFrame("A"));
        expect(h.state().progress == 0.3_d) << "duplicate scan does not restart";
        expect(h.viewer->stats().commands == 1_u);

        h.viewer->handleFrame(test::scanFrame("B"));
        expect(h.state().phase == Phase::EnteringCard);
        expect(h.state().progress == 0.0_d);
        expect(h.state().activeCard->id == "B");
        h.ticks(7);
        expect(h.state().phase == Phase::Steady);

        h.viewer->handleFrame(test::removedFrame());
        expect(!h.viewer->presence().hasCard());
        expect(h.state().phase == Phase::ExitingCard);
        expect(h.state().activeCard->id == "B");
        h.ticks(10);
        expect(h.state().phase == Phase::Idle);
        expect(h.state().activeCard == nullptr);
        expect(h.violations.empty());
        expect(h.viewer->stats().commands == 3_u);
    };

    "removal with nothing shown is a no-op"_test = [] {
        Harness h;
        expect((h.viewer != nullptr) >> fatal);
        h.viewer->handleFrame(test::removedFrame());
        expect(h.state().phase == Phase::Idle);
        expect(h.viewer->stats().commands == 0_u);
        expect(h.viewer->stats().framesAccepted == 1_u);
    };

    "frames dispatched on the loop are applied"_test = [] {
        Harness h;
        expect((h.viewer != nullptr) >> fatal);
        auto res = h.loop->dispatch(base::Event::frameEvent(test::scanFrame("C")));
        expect((res.has_value()) >> fatal);
        expect(*res) << "viewer consumes frames";
        expect(h.state().activeCard->id == "C");
    };

    "connection loss keeps the card by default"_test = [] {
        Harness h;
        expect((h.viewer != nullptr) >> fatal);
        h.viewer->handleFrame(test::scanFrame("A"));
        auto up = h.loop->dispatch(base::Event::connectionEvent(
            static_cast<uint8_t>(TransportClient::Health::Connected), 0));
        auto down = h.loop->dispatch(base::Event::connectionEvent(
            static_cast<uint8_t>(TransportClient::Health::Reconnecting), 1));
        expect(up.has_value() && down.has_value());
        expect(h.viewer->connectionHealth() == TransportClient::Health::Reconnecting);
        expect(h.viewer->presence().hasCard());
        expect(h.state().phase == Phase::EnteringCard);
    };

    "connection loss clears the card when configured"_test = [] {
        Harness h(testSettings(true));
        expect((h.viewer != nullptr) >> fatal);
        auto up = h.loop->dispatch(base::Event::connectionEvent(
            static_cast<uint8_t>(TransportClient::Health::Connected), 0));
        h.viewer->handleFrame(test::scanFrame("A"));
        auto down = h.loop->dispatch(base::Event::connectionEvent(
            static_cast<uint8_t>(TransportClient::Health::Reconnecting), 1));
        expect(up.has_value() && down.has_value());
        expect(!h.viewer->presence().hasCard());
        expect(h.state().phase == Phase::ExitingCard);
    };

    "reconnecting without a prior connection does not clear"_test = [] {
        Harness h(testSettings(true));
        expect((h.viewer != nullptr) >> fatal);
        h.viewer->handleFrame(test::scanFrame("A"));
        auto res = h.loop->dispatch(base::Event::connectionEvent(
            static_cast<uint8_t>(TransportClient::Health::Reconnecting), 1));
        expect(res.has_value());
        expect(h.viewer->presence().hasCard());
    };
};
