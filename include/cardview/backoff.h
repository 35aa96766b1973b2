#pragma once

#include <algorithm>
#include <cstdint>

namespace cardview {

// Bounded exponential retry delay: initial, 2x initial, ... capped at max.
// reset() after a successful connect starts the sequence over.
class Backoff {
public:
    Backoff(uint64_t initialMs = 1000, uint64_t maxMs = 30000)
        : _initialMs(std::max<uint64_t>(initialMs, 1))
        , _maxMs(std::max(maxMs, _initialMs))
        , _nextMs(_initialMs) {}

    // Delay to wait before the next attempt; advances the sequence
    uint64_t next() {
        uint64_t delay = _nextMs;
        _nextMs = (_nextMs > _maxMs / 2) ? _maxMs : _nextMs * 2;
        ++_attempts;
        return delay;
    }

    uint64_t peek() const { return _nextMs; }

    void reset() {
        _nextMs = _initialMs;
        _attempts = 0;
    }

    // Retries handed out since the last reset()
    uint32_t attempts() const { return _attempts; }

    uint64_t initialMs() const { return _initialMs; }
    uint64_t maxMs() const { return _maxMs; }

private:
    uint64_t _initialMs;
    uint64_t _maxMs;
    uint64_t _nextMs;
    uint32_t _attempts = 0;
};

} // namespace cardview
