#pragma once

#include <cardview/presence-machine.h>
#include <cardview/transition.h>
#include <functional>

namespace cardview {

//=============================================================================
// AnimationScheduler - time-stepped driver for TransitionState.
//
// Commands from the presence machine change the phase immediately; tick()
// advances progress by dt / duration, clamped to 1.0. The tick that lands on
// 1.0 is delivered as-is and the following tick completes the phase
// (EnteringCard -> Steady, ExitingCard -> Idle).
//
// Not thread safe. Commands and ticks must come from the same loop.
//=============================================================================
class AnimationScheduler {
public:
    // Receives every post-tick state together with the eased progress
    using TickSink = std::function<void(const TransitionState& state, double eased)>;

    explicit AnimationScheduler(const TimingSettings& timing, InvariantSink invariantSink = {});

    void apply(const RenderCommand& command);

    // Advance by dtMs, then hand the new state to the tick sink
    const TransitionState& tick(uint64_t dtMs);

    void setTickSink(TickSink sink) { _tickSink = std::move(sink); }

    const TransitionState& state() const { return _state; }
    double easedProgress() const { return ease(_timing.easing, _state.progress); }

    // Duration of the phase in flight, 0 for Idle/Steady
    uint32_t activeDurationMs() const { return _durationMs; }

    const TimingSettings& timing() const { return _timing; }
    uint64_t ticks() const { return _ticks; }
    uint64_t violations() const { return _violations; }

private:
    void beginEnter(const CardData::Ptr& card, uint32_t durationMs);
    void beginExit(const CardData::Ptr& card);
    void setPhase(Phase phase, uint32_t durationMs);
    void reportViolation(InvariantViolation violation);

    TimingSettings _timing;
    InvariantSink _invariantSink;
    TickSink _tickSink;

    TransitionState _state;
    uint32_t _durationMs = 0;
    uint64_t _elapsedMs = 0;
    uint64_t _ticks = 0;
    uint64_t _violations = 0;
};

} // namespace cardview
