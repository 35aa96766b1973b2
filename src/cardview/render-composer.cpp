#include <cardview/render-composer.h>
#include <cardview/card-presentation.h>
#include <ytrace/ytrace.hpp>

namespace cardview {

double visibility(const RenderFrame& frame) {
    switch (frame.transition.phase) {
        case Phase::Idle:         return 0.0;
        case Phase::EnteringCard: return frame.eased;
        case Phase::Steady:       return 1.0;
        case Phase::ExitingCard:  return 1.0 - frame.eased;
    }
    return 0.0;
}

//=============================================================================
// FrameMailbox
//=============================================================================

void FrameMailbox::render(const RenderFrame& frame) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_slot) ++_coalesced;
        _slot = frame;
        ++_posted;
    }
    _cv.notify_one();
}

std::optional<RenderFrame> FrameMailbox::take() {
    std::lock_guard<std::mutex> lock(_mutex);
    std::optional<RenderFrame> out;
    out.swap(_slot);
    return out;
}

std::optional<RenderFrame> FrameMailbox::waitAndTake(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(_mutex);
    _cv.wait_for(lock, timeout, [this] { return _slot.has_value(); });
    std::optional<RenderFrame> out;
    out.swap(_slot);
    return out;
}

uint64_t FrameMailbox::posted() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _posted;
}

uint64_t FrameMailbox::coalesced() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _coalesced;
}

//=============================================================================
// LogComposer
//=============================================================================

void LogComposer::render(const RenderFrame& frame) {
    ++_frames;

    const auto& card = frame.card();
    std::string cardId = card ? card->id : "";
    if (_lastPhase == frame.phase() && _lastCardId == cardId) return;

    _lastPhase = frame.phase();
    _lastCardId = cardId;
    ++_phaseChanges;

    if (!card) {
        yinfo("[frame {}] {} - empty display", frame.index, phaseName(frame.phase()));
        return;
    }

    yinfo("[frame {}] {} - {} '{}' ({} {}) {}", frame.index, phaseName(frame.phase()),
          card->id, card->name, frameStyleName(card->frameStyle()),
          card->isPendulum() ? "pendulum" : "", statLine(*card));

    if (frame.style) {
        auto limits = limitationView(*card, *frame.style);
        if (limits.setId) ydebug("  set id: {}", *limits.setId);
        if (limits.passcode) ydebug("  passcode: {}", *limits.passcode);
        if (limits.edition) ydebug("  edition: {}", *limits.edition);
        if (limits.copyright) ydebug("  copyright: {}", *limits.copyright);
        if (limits.sticker) ydebug("  sticker: {}", stickerName(*limits.sticker));
    }
}

} // namespace cardview
