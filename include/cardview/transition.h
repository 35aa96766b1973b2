#pragma once

#include <cardview/card-data.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace cardview {

enum class Phase : uint8_t {
    Idle,
    EnteringCard,
    Steady,
    ExitingCard
};

const char* phaseName(Phase phase);

// Owned and mutated only by AnimationScheduler; everyone else sees copies.
// progress is linear in [0, 1] and only moves while entering or exiting.
struct TransitionState {
    Phase phase = Phase::Idle;
    double progress = 0.0;
    CardData::Ptr activeCard;  // null only while Idle
};

//=============================================================================
// Easing curves applied to progress before it reaches a composer
//=============================================================================
enum class Easing : uint8_t {
    Linear,
    InQuad,
    OutQuad,
    InOutQuad,
    InOutCubic
};

double ease(Easing easing, double t);

const char* easingName(Easing easing);
std::optional<Easing> easingFromName(const std::string& name);

struct TimingSettings {
    uint32_t tickMs = 16;
    uint32_t enterMs = 500;
    uint32_t swapMs = 350;
    uint32_t exitMs = 250;
    Easing easing = Easing::InOutQuad;
};

//=============================================================================
// Invariant violations - upstream state and scheduler state disagree
//=============================================================================
struct InvariantViolation {
    std::string what;
    std::string expectedId;  // card the command targeted
    std::string actualId;    // card the scheduler holds, empty if none
};

using InvariantSink = std::function<void(const InvariantViolation&)>;

} // namespace cardview
