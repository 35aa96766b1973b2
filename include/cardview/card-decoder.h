#pragma once

#include <cardview/card-data.h>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace cardview {

//=============================================================================
// Presence events - one per accepted wire frame
//=============================================================================
struct CardScanned {
    CardData::Ptr card;
};

struct CardRemoved {};

using PresenceEvent = std::variant<CardScanned, CardRemoved>;

const char* presenceEventName(const PresenceEvent& event);

//=============================================================================
// SchemaError - why a frame was rejected
//=============================================================================
struct SchemaError {
    enum class Kind : uint8_t {
        Malformed,     // not parseable / not a JSON object
        MissingField,  // required field absent
        InvalidField   // required field present with the wrong shape
    };

    Kind kind = Kind::Malformed;
    std::string field;          // offending field, empty for Malformed
    std::string detail;         // parser message or expected shape
    std::string discriminator;  // status value when one was detected

    static SchemaError malformed(std::string detail) {
        return {Kind::Malformed, {}, std::move(detail), {}};
    }
    static SchemaError missingField(std::string field, std::string discriminator = {}) {
        return {Kind::MissingField, std::move(field), {}, std::move(discriminator)};
    }
    static SchemaError invalidField(std::string field, std::string detail, std::string discriminator = {}) {
        return {Kind::InvalidField, std::move(field), std::move(detail), std::move(discriminator)};
    }

    // "MissingField(id) [status=NewCard]"
    std::string toString() const;
};

const char* schemaErrorKindName(SchemaError::Kind kind);

//=============================================================================
// CardDecoder - converts one raw frame into a PresenceEvent.
//
// Pure: no logging, no state. Unknown fields are ignored. Optional fields
// never cause a rejection; they fall back to the sentinels in CardData.
//=============================================================================
class CardDecoder {
public:
    static constexpr const char* kStatusField = "status";
    static constexpr const char* kScanStatus = "NewCard";

    static std::expected<PresenceEvent, SchemaError> decode(std::string_view frame);
};

} // namespace cardview
