#include <boost/ut.hpp>
#include <cardview/card-presentation.h>
#include "fixtures.h"

using namespace boost::ut;
using namespace cardview;

namespace {

std::shared_ptr<CardData> card(const std::string& frameType) {
    auto c = std::make_shared<CardData>();
    c->id = "1";
    c->frameType = frameType;
    return c;
}

StyleConfig allLimitations() {
    StyleConfig style;
    style.limitations = {true, true, true, true, true};
    return style;
}

} // namespace

//=============================================================================
// Stats and stars
//=============================================================================

suite card_stats_tests = [] {
    "stat text"_test = [] {
        expect(statText(CardStat::of(2500)) == "2500");
        expect(statText(CardStat::of(0)) == "0");
        expect(statText(CardStat::unknown()) == "?");
        expect(statText(CardStat::absent()).empty());
    };

    "monster stat line"_test = [] {
        auto c = card("effect");
        c->atk = CardStat::of(1800);
        c->def = CardStat::unknown();
        expect(statLine(*c) == "ATK/1800 DEF/?");
    };

    "link stat line uses the rating instead of DEF"_test = [] {
        auto c = card("link");
        c->atk = CardStat::of(2300);
        c->def = CardStat::of(999);
        c->linkRating = 3;
        expect(statLine(*c) == "ATK/2300 LINK-3");
    };

    "spells and traps have no stat line"_test = [] {
        expect(statLine(*card("spell")).empty());
        expect(statLine(*card("trap")).empty());
    };

    "stars are capped per frame family"_test = [] {
        auto monster = card("normal");
        monster->level = 15;
        expect(starCount(*monster) == 12_i);
        expect(!isRankStars(*monster));

        auto xyz = card("xyz");
        xyz->level = 13;
        expect(starCount(*xyz) == 13_i);
        expect(isRankStars(*xyz));

        auto link = card("link");
        link->level = 4;
        expect(starCount(*link) == 0_i);

        expect(starCount(*card("effect")) == 0_i) << "no level";
    };

    "pendulum frames keep their base family"_test = [] {
        auto c = card("effect_pendulum");
        c->level = 5;
        expect(c->isPendulum());
        expect(c->frameStyle() == FrameStyle::Effect);
        expect(starCount(*c) == 5_i);
        expect(card("xyz_pendulum")->frameStyle() == FrameStyle::Xyz);
    };

    "unrecognised frame types render as tokens"_test = [] {
        expect(card("skill")->frameStyle() == FrameStyle::Token);
        expect(card(kUnknown)->frameStyle() == FrameStyle::Token);
    };
};

//=============================================================================
// Limitation block
//=============================================================================

suite limitation_view_tests = [] {
    "nothing shown when toggles are off"_test = [] {
        auto c = card("normal");
        c->setId = "LOB-005";
        c->passcode = "46986414";
        auto view = limitationView(*c, StyleConfig{});
        expect(!view.setId.has_value());
        expect(!view.passcode.has_value());
        expect(!view.edition.has_value());
        expect(!view.copyright.has_value());
        expect(!view.sticker.has_value());
    };

    "set id and passcode shown when present"_test = [] {
        auto c = card("normal");
        c->setId = "LOB-005";
        auto view = limitationView(*c, allLimitations());
        expect(view.setId == std::optional<std::string>("LOB-005"));
        expect(!view.passcode.has_value()) << "empty passcode stays hidden";
    };

    "copyright falls back to the default line"_test = [] {
        auto c = card("normal");
        auto view = limitationView(*c, allLimitations());
        expect(view.copyright == std::optional<std::string>(kDefaultCopyright));

        c->copyright = "1996 KAZUKI TAKAHASHI";
        view = limitationView(*c, allLimitations());
        expect(view.copyright == std::optional<std::string>("1996 KAZUKI TAKAHASHI"));
    };

    "unlimited edition hides the edition and uses a silver sticker"_test = [] {
        auto c = card("normal");
        c->edition = kUnlimitedEdition;
        auto view = limitationView(*c, allLimitations());
        expect(!view.edition.has_value());
        expect(view.sticker == std::optional<Sticker>(Sticker::Silver));
    };

    "limited edition is upper-cased with a gold sticker"_test = [] {
        auto c = card("normal");
        c->edition = "Limited Edition";
        auto view = limitationView(*c, allLimitations());
        expect(view.edition == std::optional<std::string>("LIMITED EDITION"));
        expect(view.sticker == std::optional<Sticker>(Sticker::Gold));
    };

    "other editions are shown as sent"_test = [] {
        auto c = card("normal");
        c->edition = "1st Edition";
        auto view = limitationView(*c, allLimitations());
        expect(view.edition == std::optional<std::string>("1st Edition"));
        expect(view.sticker == std::optional<Sticker>(Sticker::Gold));
    };

    "no edition at all means silver"_test = [] {
        auto view = limitationView(*card("normal"), allLimitations());
        expect(view.sticker == std::optional<Sticker>(Sticker::Silver));
        expect(std::string(stickerName(*view.sticker)) == "silver");
    };
};
