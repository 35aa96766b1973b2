#pragma once

#include <cardview/card-decoder.h>
#include <optional>

namespace cardview {

//=============================================================================
// Render commands emitted by the presence machine toward the scheduler
//=============================================================================
struct RenderCommand {
    enum class Kind : uint8_t {
        BeginEnter,       // enter from an empty display
        PreemptAndEnter,  // swap directly to another card
        BeginExit         // card was removed
    };

    Kind kind;
    CardData::Ptr card;

    static RenderCommand beginEnter(CardData::Ptr c) { return {Kind::BeginEnter, std::move(c)}; }
    static RenderCommand preemptAndEnter(CardData::Ptr c) { return {Kind::PreemptAndEnter, std::move(c)}; }
    static RenderCommand beginExit(CardData::Ptr c) { return {Kind::BeginExit, std::move(c)}; }
};

const char* renderCommandName(RenderCommand::Kind kind);

//=============================================================================
// PresenceMachine - NoCard / HasCard(card)
//
//   NoCard      + Scanned(c)                -> HasCard(c)   BeginEnter(c)
//   HasCard(c1) + Scanned(c2), same id      -> HasCard(c1)  (none)
//   HasCard(c1) + Scanned(c2), other id     -> HasCard(c2)  PreemptAndEnter(c2)
//   HasCard(c)  + Removed                   -> NoCard       BeginExit(c)
//   NoCard      + Removed                   -> NoCard       (none)
//
// Total over its inputs; never fails.
//=============================================================================
class PresenceMachine {
public:
    std::optional<RenderCommand> apply(const PresenceEvent& event);

    bool hasCard() const { return _card != nullptr; }
    const CardData::Ptr& card() const { return _card; }

    uint64_t eventsApplied() const { return _eventsApplied; }
    uint64_t duplicatesSuppressed() const { return _duplicates; }

private:
    std::optional<RenderCommand> onScanned(const CardData::Ptr& card);
    std::optional<RenderCommand> onRemoved();

    CardData::Ptr _card;
    uint64_t _eventsApplied = 0;
    uint64_t _duplicates = 0;
};

} // namespace cardview
