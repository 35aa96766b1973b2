//=============================================================================
// Backoff Tests
//=============================================================================

#include <boost/ut.hpp>
#include <cardview/backoff.h>

using namespace boost::ut;
using namespace cardview;

suite backoff_tests = [] {
    "doubles from the initial delay up to the cap"_test = [] {
        Backoff backoff(1000, 30000);
        expect(backoff.next() == 1000_u);
        expect(backoff.next() == 2000_u);
        expect(backoff.next() == 4000_u);
        expect(backoff.next() == 8000_u);
        expect(backoff.next() == 16000_u);
        expect(backoff.next() == 30000_u);
        expect(backoff.next() == 30000_u);
        expect(backoff.attempts() == 7_u);
    };

    "reset starts over"_test = [] {
        Backoff backoff(500, 4000);
        backoff.next();
        backoff.next();
        backoff.reset();
        expect(backoff.attempts() == 0_u);
        expect(backoff.next() == 500_u);
    };

    "cap below initial is raised to initial"_test = [] {
        Backoff backoff(2000, 100);
        expect(backoff.maxMs() == 2000_u);
        expect(backoff.next() == 2000_u);
        expect(backoff.next() == 2000_u);
    };

    "never exceeds the cap"_test = [] {
        Backoff backoff(7, 1000);
        for (int i = 0; i < 64; ++i) {
            expect(backoff.next() <= 1000_u);
        }
    };
};
