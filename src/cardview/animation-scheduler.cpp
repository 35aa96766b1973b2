#include <cardview/animation-scheduler.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace cardview {

AnimationScheduler::AnimationScheduler(const TimingSettings& timing, InvariantSink invariantSink)
    : _timing(timing)
    , _invariantSink(std::move(invariantSink)) {}

void AnimationScheduler::apply(const RenderCommand& command) {
    if (!command.card) {
        reportViolation({std::string(renderCommandName(command.kind)) + " without a card", "",
                         _state.activeCard ? _state.activeCard->id : ""});
        return;
    }

    switch (command.kind) {
        case RenderCommand::Kind::BeginEnter:
            // From ExitingCard this abandons the exit
            beginEnter(command.card, _timing.enterMs);
            break;

        case RenderCommand::Kind::PreemptAndEnter:
            if (_state.phase == Phase::EnteringCard || _state.phase == Phase::Steady) {
                ydebug("AnimationScheduler: preempting {} at {:.3f} for {}",
                       _state.activeCard ? _state.activeCard->id : "", _state.progress, command.card->id);
            }
            beginEnter(command.card, _timing.swapMs);
            break;

        case RenderCommand::Kind::BeginExit:
            beginExit(command.card);
            break;
    }
}

void AnimationScheduler::beginEnter(const CardData::Ptr& card, uint32_t durationMs) {
    _state.activeCard = card;
    setPhase(Phase::EnteringCard, durationMs);
}

void AnimationScheduler::beginExit(const CardData::Ptr& card) {
    const auto& active = _state.activeCard;
    if (!active || active->id != card->id || _state.phase == Phase::Idle) {
        reportViolation({"BeginExit for a card that is not active", card->id, active ? active->id : ""});
        return;
    }
    if (_state.phase == Phase::ExitingCard) {
        ydebug("AnimationScheduler: {} already exiting", card->id);
        return;
    }
    setPhase(Phase::ExitingCard, _timing.exitMs);
}

const TransitionState& AnimationScheduler::tick(uint64_t dtMs) {
    ++_ticks;

    switch (_state.phase) {
        case Phase::EnteringCard:
        case Phase::ExitingCard:
            if (_state.progress >= 1.0) {
                // Completed on the previous tick
                if (_state.phase == Phase::EnteringCard) {
                    setPhase(Phase::Steady, 0);
                } else {
                    _state.activeCard.reset();
                    setPhase(Phase::Idle, 0);
                }
                break;
            }
            _elapsedMs += dtMs;
            if (_durationMs == 0 || _elapsedMs >= _durationMs) {
                _state.progress = 1.0;
            } else {
                double p = static_cast<double>(_elapsedMs) / static_cast<double>(_durationMs);
                _state.progress = std::max(_state.progress, std::min(p, 1.0));
            }
            break;

        case Phase::Idle:
        case Phase::Steady:
            break;
    }

    if (_tickSink) {
        _tickSink(_state, easedProgress());
    }
    return _state;
}

void AnimationScheduler::setPhase(Phase phase, uint32_t durationMs) {
    if (phase != _state.phase) {
        ydebug("AnimationScheduler: {} -> {} ({})", phaseName(_state.phase), phaseName(phase),
               _state.activeCard ? _state.activeCard->id : "-");
    }
    _state.phase = phase;
    _state.progress = 0.0;
    _durationMs = durationMs;
    _elapsedMs = 0;
}

void AnimationScheduler::reportViolation(InvariantViolation violation) {
    ++_violations;
    yerror("AnimationScheduler: invariant violation: {} (expected '{}', active '{}')",
           violation.what, violation.expectedId, violation.actualId);
    if (_invariantSink) {
        _invariantSink(violation);
    }
}

} // namespace cardview
