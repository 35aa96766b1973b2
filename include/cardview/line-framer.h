#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cardview {

// Splits a byte stream into newline-terminated frames.
//
// Partial input is buffered across feed() calls; only complete frames are
// emitted. A trailing '\r' is stripped and blank lines are skipped. A frame
// growing past maxFrameBytes is discarded up to its terminating newline.
class LineFramer {
public:
    using FrameCallback = std::function<void(std::string frame)>;

    static constexpr size_t DEFAULT_MAX_FRAME_BYTES = 16 * 1024 * 1024;

    explicit LineFramer(size_t maxFrameBytes = DEFAULT_MAX_FRAME_BYTES)
        : _maxFrameBytes(maxFrameBytes) {}

    // Returns the number of frames emitted
    size_t feed(std::string_view data, const FrameCallback& onFrame);

    // Drop any partially received frame (connection lost)
    void reset();

    size_t pendingBytes() const { return _partial.size(); }
    uint64_t droppedFrames() const { return _droppedFrames; }
    size_t maxFrameBytes() const { return _maxFrameBytes; }

private:
    void emit(std::string frame, const FrameCallback& onFrame, size_t& count);

    std::string _partial;
    size_t _maxFrameBytes;
    bool _discarding = false;
    uint64_t _droppedFrames = 0;
};

} // namespace cardview
