//=============================================================================
// ClockSource Tests
//=============================================================================

#include <boost/ut.hpp>
#include <lazybar/sources/clock-source.h>
#include <cstdlib>
#include <ctime>
#include <thread>

using namespace boost::ut;
using namespace lazybar;
using namespace std::chrono_literals;

namespace {

// 2024-01-02 03:04:05 UTC
const ClockSource::TimePoint kFixed = std::chrono::system_clock::from_time_t(1704164645);

void useUtc() {
    setenv("TZ", "UTC", 1);
    tzset();
}

std::tm at(int hour, int min, int sec) {
    std::tm t{};
    t.tm_year = 124;
    t.tm_mon = 0;
    t.tm_mday = 2;
    t.tm_hour = hour;
    t.tm_min = min;
    t.tm_sec = sec;
    return t;
}

} // namespace

suite clock_source_tests = [] {
    "next boundary per precision"_test = [] {
        using P = ClockSource::Precision;
        expect(ClockSource::untilNextBoundary(P::Seconds, at(3, 4, 5), 250).count() == 750_i);
        expect(ClockSource::untilNextBoundary(P::Minutes, at(3, 4, 5), 0).count() == 55000_i);
        expect(ClockSource::untilNextBoundary(P::Minutes, at(3, 4, 59), 999).count() == 1_i);
        expect(ClockSource::untilNextBoundary(P::Hours, at(3, 59, 0), 0).count() == 60000_i);
        expect(ClockSource::untilNextBoundary(P::Days, at(23, 0, 0), 500).count() == 3599500_i);
    };

    "leap second never yields a non-positive delay"_test = [] {
        auto d = ClockSource::untilNextBoundary(ClockSource::Precision::Minutes, at(23, 59, 60), 500);
        expect(d.count() >= 1_i);
    };

    "precision names"_test = [] {
        expect(ClockSource::precisionFromName("days") == ClockSource::Precision::Days);
        expect(ClockSource::precisionFromName("seconds") == ClockSource::Precision::Seconds);
        expect(!ClockSource::precisionFromName("fortnights").has_value());
    };

    "formats local time"_test = [] {
        useUtc();
        auto clock = *ClockSource::create("%Y-%m-%d %H:%M:%S", ClockSource::Precision::Seconds,
                                          [] { return kFixed; });
        auto text = clock->format(kFixed);
        expect(text.has_value());
        expect(*text == "2024-01-02 03:04:05");
    };

    "long formats grow the buffer"_test = [] {
        useUtc();
        std::string format(300, 'x');
        format += "%Y";
        auto clock = *ClockSource::create(format, ClockSource::Precision::Days);
        auto text = clock->format(kFixed);
        expect(text.has_value());
        expect(text->size() == 304_u);
    };

    "first item is emitted immediately"_test = [] {
        useUtc();
        auto clock = *ClockSource::create("%H:%M", ClockSource::Precision::Minutes, [] { return kFixed; });
        SourceContext ctx(std::make_shared<base::CancelToken>());

        auto start = std::chrono::steady_clock::now();
        auto item = clock->next(ctx);
        expect(std::chrono::steady_clock::now() - start < 500ms);
        expect(item.has_value() && item->has_value());
        expect((*item)->segments[0].text == "03:04");
    };

    "waits for the boundary and ends on cancel"_test = [] {
        useUtc();
        auto clock = *ClockSource::create("%T", ClockSource::Precision::Minutes, [] { return kFixed; });
        auto token = std::make_shared<base::CancelToken>();
        SourceContext ctx(token);
        clock->next(ctx);

        std::thread canceller([token] {
            std::this_thread::sleep_for(30ms);
            token->cancel();
        });
        auto start = std::chrono::steady_clock::now();
        auto item = clock->next(ctx);  // 55s to the boundary
        canceller.join();

        expect(std::chrono::steady_clock::now() - start < 5s);
        expect(item.has_value() && !item->has_value());
    };

    "actions do not cut the wait short"_test = [] {
        useUtc();
        // 05.900 -> next second in 100ms
        const auto now = kFixed + 900ms;
        auto clock = *ClockSource::create("%S", ClockSource::Precision::Seconds, [now] { return now; });
        SourceContext ctx(std::make_shared<base::CancelToken>());
        clock->next(ctx);

        ctx.pushAction(Action{"exec", "ignored"});
        auto start = std::chrono::steady_clock::now();
        auto item = clock->next(ctx);
        expect(std::chrono::steady_clock::now() - start >= 90ms);
        expect(item.has_value() && item->has_value());
        expect(!ctx.hasAction());
    };

    "empty format is rejected"_test = [] {
        expect(!ClockSource::create("", ClockSource::Precision::Minutes).has_value());
    };
};
