#include <cardview/presence-machine.h>
#include <ytrace/ytrace.hpp>

namespace cardview {

const char* renderCommandName(RenderCommand::Kind kind) {
    switch (kind) {
        case RenderCommand::Kind::BeginEnter:      return "BeginEnter";
        case RenderCommand::Kind::PreemptAndEnter: return "PreemptAndEnter";
        case RenderCommand::Kind::BeginExit:       return "BeginExit";
    }
    return "Unknown";
}

std::optional<RenderCommand> PresenceMachine::apply(const PresenceEvent& event) {
    ++_eventsApplied;
    if (const auto* scanned = std::get_if<CardScanned>(&event)) {
        return onScanned(scanned->card);
    }
    return onRemoved();
}

std::optional<RenderCommand> PresenceMachine::onScanned(const CardData::Ptr& card) {
    if (!card) return std::nullopt;

    if (!_card) {
        ydebug("PresenceMachine: NoCard -> HasCard({})", card->id);
        _card = card;
        return RenderCommand::beginEnter(_card);
    }

    // Passive NFC readers repeat scans of a card left on the reader
    if (_card->id == card->id) {
        ++_duplicates;
        return std::nullopt;
    }

    ydebug("PresenceMachine: HasCard({}) -> HasCard({})", _card->id, card->id);
    _card = card;
    return RenderCommand::preemptAndEnter(_card);
}

std::optional<RenderCommand> PresenceMachine::onRemoved() {
    if (!_card) return std::nullopt;

    ydebug("PresenceMachine: HasCard({}) -> NoCard", _card->id);
    CardData::Ptr removed = std::move(_card);
    _card.reset();
    return RenderCommand::beginExit(std::move(removed));
}

} // namespace cardview
