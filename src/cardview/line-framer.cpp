#include <cardview/line-framer.h>
#include <ytrace/ytrace.hpp>

namespace cardview {

size_t LineFramer::feed(std::string_view data, const FrameCallback& onFrame) {
    size_t count = 0;

    while (!data.empty()) {
        size_t nl = data.find('\n');
        std::string_view chunk = data.substr(0, nl);

        if (_discarding) {
            // Skip the rest of an oversized frame
            if (nl == std::string_view::npos) return count;
            _discarding = false;
            data.remove_prefix(nl + 1);
            continue;
        }

        if (_partial.size() + chunk.size() > _maxFrameBytes) {
            ywarn("LineFramer: frame exceeds {} bytes, dropping", _maxFrameBytes);
            ++_droppedFrames;
            _partial.clear();
            if (nl == std::string_view::npos) {
                _discarding = true;
                return count;
            }
            data.remove_prefix(nl + 1);
            continue;
        }

        _partial.append(chunk);
        if (nl == std::string_view::npos) return count;

        data.remove_prefix(nl + 1);
        std::string frame;
        frame.swap(_partial);
        emit(std::move(frame), onFrame, count);
    }
    return count;
}

void LineFramer::reset() {
    if (!_partial.empty()) {
        ydebug("LineFramer: discarding {} buffered bytes", _partial.size());
    }
    _partial.clear();
    _discarding = false;
}

void LineFramer::emit(std::string frame, const FrameCallback& onFrame, size_t& count) {
    if (!frame.empty() && frame.back() == '\r') frame.pop_back();

    bool blank = frame.find_first_not_of(" \t") == std::string::npos;
    if (blank) return;

    ++count;
    if (onFrame) onFrame(std::move(frame));
}

} // namespace cardview
