#include <cardview/card-viewer.h>
#include <cardview/card-decoder.h>
#include <ytrace/ytrace.hpp>

namespace cardview {

// Raw frames can carry a base64 image; keep log lines readable
static std::string excerpt(std::string_view frame, size_t max = 160) {
    if (frame.size() <= max) return std::string(frame);
    return std::string(frame.substr(0, max)) + "...";
}

class CardViewerImpl : public CardViewer {
public:
    CardViewerImpl(base::EventLoop::Ptr loop, const ViewerSettings& settings,
                   RenderComposer::Ptr composer, InvariantSink invariantSink)
        : _loop(std::move(loop))
        , _settings(settings)
        , _style(std::make_shared<const StyleConfig>(settings.style))
        , _composer(std::move(composer))
        , _externalSink(std::move(invariantSink))
        , _scheduler(settings.timing, [this](const InvariantViolation& v) { onViolation(v); }) {}

    ~CardViewerImpl() override {
        if (_transport) _transport->stop();
        if (_tickTimer >= 0) {
            if (auto res = _loop->destroyTimer(_tickTimer); !res) {
                ywarn("CardViewer: {}", error_msg(res));
            }
        }
    }

    Result<void> init() noexcept {
        _scheduler.setTickSink([this](const TransitionState& state, double eased) {
            renderFrame(state, eased);
        });

        auto self = sharedAs<base::EventListener>();
        if (auto res = _loop->registerListener(base::Event::Type::FrameReceived, self); !res) {
            return Err<void>("Failed to register frame listener", res);
        }
        if (auto res = _loop->registerListener(base::Event::Type::ConnectionChanged, self); !res) {
            return Err<void>("Failed to register connection listener", res);
        }

        auto timerRes = _loop->createTimer();
        if (!timerRes) {
            return Err<void>("Failed to create animation timer", timerRes);
        }
        _tickTimer = *timerRes;
        if (auto res = _loop->configTimer(_tickTimer, static_cast<base::Timeout>(_settings.timing.tickMs)); !res) {
            return Err<void>("Failed to configure animation timer", res);
        }
        if (auto res = _loop->registerTimerListener(_tickTimer, self); !res) {
            return Err<void>("Failed to register animation timer listener", res);
        }

        auto transportRes = TransportClient::create(_loop, _settings.transport);
        if (!transportRes) {
            return Err<void>("Failed to create TransportClient", transportRes);
        }
        _transport = *transportRes;
        return Ok();
    }

    //=========================================================================
    // CardViewer interface
    //=========================================================================

    Result<void> start() override {
        if (auto res = _transport->start(); !res) {
            return Err<void>("Failed to start transport", res);
        }
        _lastTickMs = _loop->now();
        if (auto res = _loop->startTimer(_tickTimer); !res) {
            return Err<void>("Failed to start animation timer", res);
        }
        yinfo("CardViewer: started, tick {} ms, easing {}",
              _settings.timing.tickMs, easingName(_settings.timing.easing));
        return Ok();
    }

    Result<void> stop() override {
        _transport->stop();
        if (auto res = _loop->stopTimer(_tickTimer); !res) {
            return Err<void>("Failed to stop animation timer", res);
        }
        return Ok();
    }

    void handleFrame(std::string_view frame) override {
        auto event = CardDecoder::decode(frame);
        if (!event) {
            ++_stats.schemaErrors;
            ywarn("CardViewer: dropping frame: {} raw='{}'", event.error().toString(), excerpt(frame));
            return;
        }
        ++_stats.framesAccepted;
        applyEvent(*event);
    }

    void tick(uint64_t dtMs) override {
        _scheduler.tick(dtMs);
    }

    const PresenceMachine& presence() const override { return _presence; }
    const AnimationScheduler& scheduler() const override { return _scheduler; }
    const ViewerSettings& settings() const override { return _settings; }
    TransportClient::Health connectionHealth() const override { return _health; }
    Stats stats() const override { return _stats; }

    Result<bool> onEvent(const base::Event& event) override {
        switch (event.type) {
            case base::Event::Type::FrameReceived:
                handleFrame(event.frame());
                return Ok(true);

            case base::Event::Type::ConnectionChanged:
                onConnectionChanged(static_cast<TransportClient::Health>(event.connection.health));
                return Ok(false);

            case base::Event::Type::Timer:
                if (event.timer.timerId != _tickTimer) return Ok(false);
                {
                    uint64_t now = _loop->now();
                    uint64_t dt = now >= _lastTickMs ? now - _lastTickMs : 0;
                    _lastTickMs = now;
                    tick(dt);
                }
                return Ok(true);

            default:
                return Ok(false);
        }
    }

protected:
    Result<void> onShutdown() override {
        return stop();
    }

private:
    void applyEvent(const PresenceEvent& event) {
        auto command = _presence.apply(event);
        if (!command) {
            ydebug("CardViewer: {} produced no command", presenceEventName(event));
            return;
        }
        ++_stats.commands;
        ydebug("CardViewer: {}({})", renderCommandName(command->kind), command->card->id);
        _scheduler.apply(*command);
    }

    void onConnectionChanged(TransportClient::Health health) {
        auto previous = _health;
        _health = health;
        if (previous == TransportClient::Health::Connected &&
            health != TransportClient::Health::Connected &&
            _settings.presence.clearOnDisconnect) {
            yinfo("CardViewer: connection lost, clearing display");
            applyEvent(CardRemoved{});
        }
    }

    void renderFrame(const TransitionState& state, double eased) {
        if (!_composer) return;
        RenderFrame frame;
        frame.index = _stats.renders++;
        frame.transition = state;
        frame.eased = eased;
        frame.style = _style;
        _composer->render(frame);
    }

    void onViolation(const InvariantViolation& violation) {
        ++_stats.invariantViolations;
        if (_externalSink) _externalSink(violation);
    }

    base::EventLoop::Ptr _loop;
    ViewerSettings _settings;
    std::shared_ptr<const StyleConfig> _style;
    RenderComposer::Ptr _composer;
    InvariantSink _externalSink;

    PresenceMachine _presence;
    AnimationScheduler _scheduler;
    TransportClient::Ptr _transport;

    base::TimerId _tickTimer = -1;
    uint64_t _lastTickMs = 0;
    TransportClient::Health _health = TransportClient::Health::Disconnected;
    Stats _stats;
};

Result<CardViewer::Ptr> CardViewer::createImpl(base::EventLoop::Ptr loop,
                                               const ViewerSettings& settings,
                                               RenderComposer::Ptr composer,
                                               InvariantSink invariantSink) noexcept {
    if (!loop) {
        return Err<Ptr>("CardViewer: null event loop");
    }
    auto impl = std::make_shared<CardViewerImpl>(std::move(loop), settings,
                                                 std::move(composer), std::move(invariantSink));
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to init CardViewer", res);
    }
    return Ok<Ptr>(impl);
}

} // namespace cardview
