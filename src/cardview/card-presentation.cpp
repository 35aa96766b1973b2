#include <cardview/card-presentation.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <string_view>

namespace cardview {

static bool equalsIgnoreCase(const std::string& a, const char* b) {
    std::string_view bv(b);
    if (a.size() != bv.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(bv[i]))) {
            return false;
        }
    }
    return true;
}

std::string statText(const CardStat& stat) {
    switch (stat.kind) {
        case CardStat::Kind::Absent:  return "";
        case CardStat::Kind::Unknown: return "?";
        case CardStat::Kind::Value:   return std::to_string(stat.value);
    }
    return "";
}

std::string statLine(const CardData& card) {
    if (card.isSpellOrTrap()) return "";

    std::string line = fmt::format("ATK/{}", statText(card.atk));
    if (card.frameStyle() == FrameStyle::Link) {
        if (card.linkRating) line += fmt::format(" LINK-{}", *card.linkRating);
    } else {
        line += fmt::format(" DEF/{}", statText(card.def));
    }
    return line;
}

bool isRankStars(const CardData& card) {
    return card.frameStyle() == FrameStyle::Xyz;
}

int starCount(const CardData& card) {
    auto style = card.frameStyle();
    if (style == FrameStyle::Link || style == FrameStyle::Spell || style == FrameStyle::Trap) {
        return 0;
    }
    if (!card.level) return 0;
    int cap = isRankStars(card) ? 13 : 12;
    return std::min<int>(*card.level, cap);
}

const char* stickerName(Sticker sticker) {
    return sticker == Sticker::Gold ? "gold" : "silver";
}

LimitationView limitationView(const CardData& card, const StyleConfig& style) {
    LimitationView view;
    const auto& toggles = style.limitations;

    if (toggles.setId && !card.setId.empty()) {
        view.setId = card.setId;
    }
    if (toggles.passcode && !card.passcode.empty()) {
        view.passcode = card.passcode;
    }

    bool limitedPrint = card.edition && *card.edition != kUnlimitedEdition;
    if (toggles.edition && limitedPrint) {
        view.edition = equalsIgnoreCase(*card.edition, "limited edition") ? "LIMITED EDITION" : *card.edition;
    }

    if (toggles.copyright) {
        view.copyright = card.copyright.empty() ? std::string(kDefaultCopyright) : card.copyright;
    }
    if (toggles.sticker) {
        view.sticker = limitedPrint ? Sticker::Gold : Sticker::Silver;
    }
    return view;
}

} // namespace cardview
