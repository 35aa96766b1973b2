#pragma once

#include <cardview/card-data.h>
#include <cardview/style-config.h>
#include <optional>
#include <string>

namespace cardview {

// Presentation helpers for composers. Pure functions over CardData.

inline constexpr const char* kDefaultCopyright = "\xC2\xA9" "2020 Studio Dice/SHUEISHA, TV TOKYO, KONAMI";
inline constexpr const char* kUnlimitedEdition = "Unlimited Edition";

// "2500", "?" or "" when absent
std::string statText(const CardStat& stat);

// "ATK/2500 DEF/2100", "ATK/1200 LINK-2", or "" for spells and traps
std::string statLine(const CardData& card);

// Level stars (max 12) or XYZ rank stars (max 13); 0 for link/spell/trap
int starCount(const CardData& card);

bool isRankStars(const CardData& card);

enum class Sticker : uint8_t { Gold, Silver };

const char* stickerName(Sticker sticker);

// Limitation block as a composer should draw it; nullopt means hidden
struct LimitationView {
    std::optional<std::string> setId;
    std::optional<std::string> passcode;
    std::optional<std::string> edition;
    std::optional<std::string> copyright;
    std::optional<Sticker> sticker;
};

LimitationView limitationView(const CardData& card, const StyleConfig& style);

} // namespace cardview
