#include <cardview/card-data.h>
#include <algorithm>
#include <cctype>

namespace cardview {

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* frameStyleName(FrameStyle style) {
    switch (style) {
        case FrameStyle::Normal:  return "normal";
        case FrameStyle::Effect:  return "effect";
        case FrameStyle::Ritual:  return "ritual";
        case FrameStyle::Fusion:  return "fusion";
        case FrameStyle::Synchro: return "synchro";
        case FrameStyle::Xyz:     return "xyz";
        case FrameStyle::Link:    return "link";
        case FrameStyle::Spell:   return "spell";
        case FrameStyle::Trap:    return "trap";
        case FrameStyle::Token:   return "token";
    }
    return "token";
}

FrameStyle frameStyleOf(const std::string& frameType) {
    std::string ft = toLower(frameType);

    // Pendulum frames are "<base>_pendulum"
    if (auto pos = ft.find("_pendulum"); pos != std::string::npos) {
        ft.erase(pos);
    }

    if (ft.starts_with("xyz")) return FrameStyle::Xyz;
    if (ft == "spell") return FrameStyle::Spell;
    if (ft == "trap") return FrameStyle::Trap;
    if (ft == "link") return FrameStyle::Link;
    if (ft == "fusion") return FrameStyle::Fusion;
    if (ft == "synchro") return FrameStyle::Synchro;
    if (ft == "ritual") return FrameStyle::Ritual;
    if (ft == "normal") return FrameStyle::Normal;
    if (ft == "effect") return FrameStyle::Effect;
    return FrameStyle::Token;
}

bool isPendulumFrame(const std::string& frameType) {
    return toLower(frameType).find("pendulum") != std::string::npos;
}

} // namespace cardview
