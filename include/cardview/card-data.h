#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cardview {

// Placeholder for descriptive fields the source left out
inline constexpr const char* kUnknown = "unknown";

//=============================================================================
// CardStat - ATK/DEF value. Cards may print "?" instead of a number.
//=============================================================================
struct CardStat {
    enum class Kind : uint8_t { Absent, Value, Unknown };

    Kind kind = Kind::Absent;
    int32_t value = 0;

    static CardStat absent() { return {}; }
    static CardStat of(int32_t v) { return {Kind::Value, v}; }
    static CardStat unknown() { return {Kind::Unknown, 0}; }

    bool isAbsent() const { return kind == Kind::Absent; }
    bool isUnknown() const { return kind == Kind::Unknown; }
    bool hasValue() const { return kind == Kind::Value; }

    bool operator==(const CardStat&) const = default;
};

// Which limitation attributes the source message carried
struct LimitationFlags {
    bool setId = false;
    bool passcode = false;
    bool copyright = false;
    bool sticker = false;
    bool edition = false;

    bool operator==(const LimitationFlags&) const = default;
};

//=============================================================================
// Frame style - border family derived from the frameType field
//=============================================================================
enum class FrameStyle : uint8_t {
    Normal,
    Effect,
    Ritual,
    Fusion,
    Synchro,
    Xyz,
    Link,
    Spell,
    Trap,
    Token
};

const char* frameStyleName(FrameStyle style);

// "effect_pendulum" -> Effect; anything unrecognised falls back to Token
FrameStyle frameStyleOf(const std::string& frameType);

bool isPendulumFrame(const std::string& frameType);

//=============================================================================
// CardData - one validated card. Immutable once the decoder hands it out;
// shared as shared_ptr<const CardData> between presence and animation state.
//=============================================================================
struct CardData {
    using Ptr = std::shared_ptr<const CardData>;

    std::string id;

    // Descriptive strings, kUnknown when absent
    std::string name = kUnknown;
    std::string cardType = kUnknown;
    std::string frameType = kUnknown;
    std::string attribute = kUnknown;
    std::string race = kUnknown;

    std::optional<uint8_t> level;
    std::optional<uint8_t> linkRating;
    std::optional<uint8_t> scale;

    CardStat atk;
    CardStat def;

    std::string lore;
    std::string pendulumLore;
    std::vector<std::string> linkMarkers;
    std::vector<std::string> typeline;

    // Opaque to the core; resolved by the composer
    std::string imageRef;

    LimitationFlags limitationFlags;
    std::string setId;
    std::string passcode;
    std::string copyright;
    std::string sticker;

    std::optional<std::string> rarity;
    std::optional<std::string> edition;
    std::optional<std::string> copyrightYear;

    FrameStyle frameStyle() const { return frameStyleOf(frameType); }
    bool isPendulum() const { return isPendulumFrame(frameType); }
    bool isSpellOrTrap() const {
        auto s = frameStyle();
        return s == FrameStyle::Spell || s == FrameStyle::Trap;
    }
};

} // namespace cardview
