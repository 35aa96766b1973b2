//=============================================================================
// LineFramer Tests
//
// Newline framing across partial reads, CRLF handling, size limit and
// reset on disconnect.
//=============================================================================

#include <boost/ut.hpp>
#include <cardview/line-framer.h>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace cardview;

namespace {

struct Collector {
    std::vector<std::string> frames;
    LineFramer::FrameCallback callback() {
        return [this](std::string frame) { frames.push_back(std::move(frame)); };
    }
};

} // namespace

suite line_framer_basic_tests = [] {
    "single complete frame"_test = [] {
        LineFramer framer;
        Collector c;
        auto n = framer.feed("{\"a\":1}\n", c.callback());
        expect(n == 1_u);
        expect((c.frames.size() == 1_u) >> fatal);
        expect(c.frames[0] == "{\"a\":1}");
        expect(framer.pendingBytes() == 0_u);
    };

    "several frames in one read"_test = [] {
        LineFramer framer;
        Collector c;
        framer.feed("one\ntwo\nthree\n", c.callback());
        expect((c.frames.size() == 3_u) >> fatal);
        expect(c.frames[0] == "one");
        expect(c.frames[2] == "three");
    };

    "partial frame is held until its newline"_test = [] {
        LineFramer framer;
        Collector c;
        framer.feed("{\"status\":", c.callback());
        expect(c.frames.empty());
        expect(framer.pendingBytes() == 10_u);

        framer.feed("\"NewCard\"}", c.callback());
        expect(c.frames.empty());

        framer.feed("\nnext", c.callback());
        expect((c.frames.size() == 1_u) >> fatal);
        expect(c.frames[0] == "{\"status\":\"NewCard\"}");
        expect(framer.pendingBytes() == 4_u);
    };

    "byte-at-a-time delivery"_test = [] {
        LineFramer framer;
        Collector c;
        std::string input = "ab\ncd\n";
        for (char ch : input) {
            framer.feed(std::string_view(&ch, 1), c.callback());
        }
        expect((c.frames.size() == 2_u) >> fatal);
        expect(c.frames[0] == "ab");
        expect(c.frames[1] == "cd");
    };

    "CRLF terminator is stripped"_test = [] {
        LineFramer framer;
        Collector c;
        framer.feed("frame\r\n", c.callback());
        expect((c.frames.size() == 1_u) >> fatal);
        expect(c.frames[0] == "frame");
    };

    "blank lines are skipped"_test = [] {
        LineFramer framer;
        Collector c;
        auto n = framer.feed("\n\r\n  \nx\n\n", c.callback());
        expect(n == 1_u);
        expect((c.frames.size() == 1_u) >> fatal);
        expect(c.frames[0] == "x");
    };
};

suite line_framer_limit_tests = [] {
    "reset drops the partial frame"_test = [] {
        LineFramer framer;
        Collector c;
        framer.feed("{\"status\":\"New", c.callback());
        framer.reset();
        expect(framer.pendingBytes() == 0_u);

        framer.feed("Card\"}\n{\"ok\":1}\n", c.callback());
        expect((c.frames.size() == 2_u) >> fatal);
        // The tail of the interrupted frame surfaces alone, never glued to its head
        expect(c.frames[0] == "Card\"}");
        expect(c.frames[1] == "{\"ok\":1}");
    };

    "oversized frame is dropped up to its newline"_test = [] {
        LineFramer framer(8);
        Collector c;
        framer.feed("0123456789", c.callback());
        expect(framer.droppedFrames() == 1_u);
        expect(framer.pendingBytes() == 0_u);

        framer.feed("abc\nok\n", c.callback());
        expect((c.frames.size() == 1_u) >> fatal);
        expect(c.frames[0] == "ok");
    };

    "oversized frame inside one read"_test = [] {
        LineFramer framer(4);
        Collector c;
        framer.feed("toolong\nfine\n", c.callback());
        expect(framer.droppedFrames() == 1_u);
        expect((c.frames.size() == 1_u) >> fatal);
        expect(c.frames[0] == "fine");
    };

    "frame exactly at the limit passes"_test = [] {
        LineFramer framer(4);
        Collector c;
        framer.feed("abcd\n", c.callback());
        expect(framer.droppedFrames() == 0_u);
        expect(c.frames.size() == 1_u);
    };
};
