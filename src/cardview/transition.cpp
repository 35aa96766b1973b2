#include <cardview/transition.h>
#include <algorithm>

namespace cardview {

const char* phaseName(Phase phase) {
    switch (phase) {
        case Phase::Idle:         return "Idle";
        case Phase::EnteringCard: return "EnteringCard";
        case Phase::Steady:       return "Steady";
        case Phase::ExitingCard:  return "ExitingCard";
    }
    return "Unknown";
}

double ease(Easing easing, double t) {
    t = std::clamp(t, 0.0, 1.0);
    switch (easing) {
        case Easing::Linear:
            return t;
        case Easing::InQuad:
            return t * t;
        case Easing::OutQuad:
            return t * (2.0 - t);
        case Easing::InOutQuad:
            return t < 0.5 ? 2.0 * t * t : 1.0 - 2.0 * (1.0 - t) * (1.0 - t);
        case Easing::InOutCubic:
            if (t < 0.5) return 4.0 * t * t * t;
            {
                double u = 1.0 - t;
                return 1.0 - 4.0 * u * u * u;
            }
    }
    return t;
}

const char* easingName(Easing easing) {
    switch (easing) {
        case Easing::Linear:     return "linear";
        case Easing::InQuad:     return "in-quad";
        case Easing::OutQuad:    return "out-quad";
        case Easing::InOutQuad:  return "in-out-quad";
        case Easing::InOutCubic: return "in-out-cubic";
    }
    return "linear";
}

std::optional<Easing> easingFromName(const std::string& name) {
    if (name == "linear") return Easing::Linear;
    if (name == "in-quad") return Easing::InQuad;
    if (name == "out-quad") return Easing::OutQuad;
    if (name == "in-out-quad") return Easing::InOutQuad;
    if (name == "in-out-cubic") return Easing::InOutCubic;
    return std::nullopt;
}

} // namespace cardview
