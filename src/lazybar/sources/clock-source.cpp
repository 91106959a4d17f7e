#include <lazybar/sources/clock-source.h>
#include <ytrace/ytrace.hpp>
#include <vector>

namespace lazybar {

ClockSource::ClockSource(std::string format, Precision precision, Now now) noexcept
    : _format(std::move(format)), _precision(precision), _now(std::move(now)) {}

Result<ClockSource::Ptr> ClockSource::create(std::string format, Precision precision, Now now) noexcept {
    if (format.empty()) {
        return Err<Ptr>("ClockSource: empty format");
    }
    if (!now) {
        now = [] { return std::chrono::system_clock::now(); };
    }
    return Ok(Ptr(new ClockSource(std::move(format), precision, std::move(now))));
}

std::optional<ClockSource::Precision> ClockSource::precisionFromName(const std::string& name) {
    if (name == "days") return Precision::Days;
    if (name == "hours") return Precision::Hours;
    if (name == "minutes") return Precision::Minutes;
    if (name == "seconds") return Precision::Seconds;
    return std::nullopt;
}

std::chrono::milliseconds ClockSource::untilNextBoundary(Precision precision, const std::tm& local, int millis) {
    long elapsed = 0;  // seconds into the current unit
    long unit = 1;
    switch (precision) {
        case Precision::Days:
            unit = 24 * 3600;
            elapsed = local.tm_hour * 3600L + local.tm_min * 60L + local.tm_sec;
            break;
        case Precision::Hours:
            unit = 3600;
            elapsed = local.tm_min * 60L + local.tm_sec;
            break;
        case Precision::Minutes:
            unit = 60;
            elapsed = local.tm_sec;
            break;
        case Precision::Seconds:
            unit = 1;
            elapsed = 0;
            break;
    }
    // Leap seconds can push tm_sec to 60
    long ms = (unit - elapsed) * 1000L - millis;
    if (ms <= 0) ms = 1;
    return std::chrono::milliseconds(ms);
}

Result<std::string> ClockSource::format(TimePoint when) const {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    if (!localtime_r(&t, &local)) {
        return Err<std::string>("ClockSource: localtime_r failed");
    }

    // strftime returns 0 both for an empty result and for a short buffer
    std::vector<char> buf(128);
    while (buf.size() <= 4096) {
        size_t n = std::strftime(buf.data(), buf.size(), _format.c_str(), &local);
        if (n > 0) {
            return Ok(std::string(buf.data(), n));
        }
        buf.resize(buf.size() * 2);
    }
    return Err<std::string>("ClockSource: format '" + _format + "' produced no output");
}

Result<std::optional<ContentItem>> ClockSource::next(SourceContext& ctx) {
    if (_started) {
        TimePoint now = _now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        if (!localtime_r(&t, &local)) {
            return Err<std::optional<ContentItem>>("ClockSource: localtime_r failed");
        }
        int millis = int(std::chrono::duration_cast<std::chrono::milliseconds>(
                             now.time_since_epoch()).count() % 1000);

        auto deadline = std::chrono::steady_clock::now() + untilNextBoundary(_precision, local, millis);
        for (;;) {
            auto res = ctx.waitUntil(deadline);
            if (res == SourceContext::WaitResult::Cancelled) {
                return Ok(std::optional<ContentItem>());
            }
            if (res == SourceContext::WaitResult::Timeout) {
                break;
            }
            // No bindings: drain whatever was queued and keep waiting
            while (ctx.takeAction()) {
            }
        }
    }
    _started = true;

    auto text = format(_now());
    if (!text) {
        return Err<std::optional<ContentItem>>("clock", text);
    }
    return Ok(std::optional<ContentItem>(ContentItem::text(*text)));
}

} // namespace lazybar
