#pragma once

//=============================================================================
// Shared test helpers: wire frames and ready-made cards
//=============================================================================

#include <cardview/card-data.h>
#include <cardview/card-decoder.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace cardview::test {

// A scan frame the way the card server sends it: card_data double-encoded
inline std::string scanFrame(const std::string& id, const std::string& name = "Dark Magician",
                             const std::string& frameType = "normal") {
    nlohmann::json cardData = {
        {"id", id},
        {"name", name},
        {"type", "Normal Monster"},
        {"frameType", frameType},
        {"attribute", "DARK"},
        {"race", "Spellcaster"},
        {"level", 7},
        {"atk", 2500},
        {"def", 2100},
        {"desc", "The ultimate wizard in terms of attack and defense."},
    };
    nlohmann::json frame = {
        {"status", "NewCard"},
        {"card_data", cardData.dump()},
        {"set_string", "LOB-005"},
        {"passcode", id},
    };
    return frame.dump();
}

inline std::string removedFrame() {
    return R"({"status":"CardRemoved"})";
}

inline CardData::Ptr makeCard(const std::string& id, const std::string& name = "card") {
    auto card = std::make_shared<CardData>();
    card->id = id;
    card->name = name;
    return card;
}

inline PresenceEvent scanned(const std::string& id) {
    return CardScanned{makeCard(id)};
}

inline PresenceEvent removed() {
    return CardRemoved{};
}

} // namespace cardview::test
