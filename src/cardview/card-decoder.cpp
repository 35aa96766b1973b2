#include <cardview/card-decoder.h>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <limits>

using json = nlohmann::json;

namespace cardview {

namespace {

std::optional<int64_t> integerOf(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number_unsigned()) {
        auto u = it->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(u);
    }
    if (it->is_number_float()) {
        double d = it->get<double>();
        if (!(d >= -1e15 && d <= 1e15)) return std::nullopt;
        if (d != static_cast<double>(static_cast<int64_t>(d))) return std::nullopt;
        return static_cast<int64_t>(d);
    }
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        size_t i = (s[0] == '-') ? 1 : 0;
        if (i == s.size() || s.size() > 18) return std::nullopt;
        for (size_t k = i; k < s.size(); ++k) {
            if (s[k] < '0' || s[k] > '9') return std::nullopt;
        }
        return std::stoll(s);
    }
    return std::nullopt;
}

// String-ish fields: strings as-is, integers (or whole floats) in decimal
std::optional<std::string> textOf(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer() || it->is_number_unsigned()) return it->dump();
    if (it->is_number_float()) {
        if (auto v = integerOf(obj, key)) return fmt::format("{}", *v);
    }
    return std::nullopt;
}

std::string textOr(const json& obj, const char* key, const char* fallback) {
    auto text = textOf(obj, key);
    if (!text || text->empty()) return fallback;
    return *text;
}

std::optional<uint8_t> smallOf(const json& obj, const char* key) {
    auto v = integerOf(obj, key);
    if (!v || *v < 0 || *v > 255) return std::nullopt;
    return static_cast<uint8_t>(*v);
}

CardStat statOf(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return CardStat::absent();
    if (it->is_string() && it->get_ref<const std::string&>() == "?") {
        return CardStat::unknown();
    }
    auto v = integerOf(obj, key);
    if (!v) return CardStat::absent();
    if (*v == -1) return CardStat::unknown();
    if (*v < 0 || *v > std::numeric_limits<int32_t>::max()) return CardStat::absent();
    return CardStat::of(static_cast<int32_t>(*v));
}

std::vector<std::string> stringsOf(const json& obj, const char* key) {
    std::vector<std::string> out;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

std::optional<std::string> optionalText(const json& obj, const char* key) {
    auto text = textOf(obj, key);
    if (!text || text->empty()) return std::nullopt;
    return text;
}

// card_data arrives either as an object or double-encoded as a JSON string
std::expected<json, SchemaError> cardDataOf(const json& root, const std::string& status) {
    auto it = root.find("card_data");
    if (it == root.end() || it->is_null()) {
        return std::unexpected(SchemaError::missingField("card_data", status));
    }
    if (it->is_object()) return *it;
    if (it->is_string()) {
        json inner = json::parse(it->get_ref<const std::string&>(), nullptr, false);
        if (inner.is_discarded()) {
            return std::unexpected(SchemaError::invalidField("card_data", "string is not valid JSON", status));
        }
        if (!inner.is_object()) {
            return std::unexpected(SchemaError::invalidField("card_data", "expected an object", status));
        }
        return inner;
    }
    return std::unexpected(SchemaError::invalidField("card_data", "expected an object or a JSON string", status));
}

std::expected<PresenceEvent, SchemaError> decodeScan(const json& root, const std::string& status) {
    auto cardData = cardDataOf(root, status);
    if (!cardData) return std::unexpected(cardData.error());
    const json& cd = *cardData;

    auto card = std::make_shared<CardData>();

    std::string id = textOf(cd, "id").value_or("");
    if (id.empty()) id = textOf(root, "passcode").value_or("");
    if (id.empty()) {
        return std::unexpected(SchemaError::missingField("id", status));
    }
    card->id = std::move(id);

    card->name = textOr(cd, "name", kUnknown);
    card->cardType = textOr(cd, "type", kUnknown);
    card->frameType = textOr(cd, "frameType", kUnknown);
    card->attribute = textOr(cd, "attribute", kUnknown);
    card->race = textOr(cd, "race", kUnknown);

    card->level = smallOf(cd, "level");
    card->linkRating = smallOf(cd, "linkval");
    card->scale = smallOf(cd, "scale");
    card->atk = statOf(cd, "atk");
    card->def = statOf(cd, "def");

    card->lore = textOr(cd, "desc", "");
    card->pendulumLore = textOr(cd, "pend_desc", "");
    card->linkMarkers = stringsOf(cd, "linkmarkers");
    card->typeline = stringsOf(cd, "typeline");

    card->imageRef = textOr(root, "card_image", "");

    card->setId = textOr(root, "set_string", "");
    card->passcode = textOr(root, "passcode", "");
    card->copyright = textOr(root, "copyright", "");
    card->sticker = textOr(root, "sticker", "");
    card->edition = optionalText(root, "edition");
    card->copyrightYear = optionalText(root, "copyright_year");
    card->rarity = optionalText(cd, "rarity");
    if (!card->rarity) card->rarity = optionalText(root, "rarity");

    card->limitationFlags.setId = !card->setId.empty();
    card->limitationFlags.passcode = !card->passcode.empty();
    card->limitationFlags.copyright = !card->copyright.empty();
    card->limitationFlags.sticker = !card->sticker.empty();
    card->limitationFlags.edition = card->edition.has_value();

    return CardScanned{std::move(card)};
}

} // namespace

const char* presenceEventName(const PresenceEvent& event) {
    return std::holds_alternative<CardScanned>(event) ? "CardScanned" : "CardRemoved";
}

const char* schemaErrorKindName(SchemaError::Kind kind) {
    switch (kind) {
        case SchemaError::Kind::Malformed:    return "Malformed";
        case SchemaError::Kind::MissingField: return "MissingField";
        case SchemaError::Kind::InvalidField: return "InvalidField";
    }
    return "Unknown";
}

std::string SchemaError::toString() const {
    std::string out = schemaErrorKindName(kind);
    if (!field.empty()) out += fmt::format("({})", field);
    if (!detail.empty()) out += fmt::format(": {}", detail);
    if (!discriminator.empty()) out += fmt::format(" [status={}]", discriminator);
    return out;
}

std::expected<PresenceEvent, SchemaError> CardDecoder::decode(std::string_view frame) {
    json root = json::parse(frame, nullptr, false);
    if (root.is_discarded()) {
        return std::unexpected(SchemaError::malformed("not valid JSON"));
    }
    if (!root.is_object()) {
        return std::unexpected(SchemaError::malformed("top level is not an object"));
    }

    auto it = root.find(kStatusField);
    if (it == root.end()) {
        return std::unexpected(SchemaError::missingField(kStatusField));
    }
    if (!it->is_string()) {
        return std::unexpected(SchemaError::invalidField(kStatusField, "expected a string"));
    }
    const std::string status = it->get<std::string>();

    // Every status other than a new scan clears the display
    if (status != kScanStatus) {
        return CardRemoved{};
    }
    return decodeScan(root, status);
}

} // namespace cardview
