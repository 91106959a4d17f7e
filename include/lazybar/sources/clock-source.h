#pragma once

#include <lazybar/result.hpp>
#include <lazybar/widget-source.h>
#include <chrono>
#include <ctime>
#include <functional>
#include <optional>
#include <string>

namespace lazybar {

/**
 * ClockSource - local wall-clock time formatted with strftime
 *
 * Emits immediately, then once at every boundary of its precision (the next
 * full day, hour, minute or second), so a minute clock flips exactly on the
 * minute instead of drifting with a fixed interval.
 */
class ClockSource : public WidgetSource {
public:
    using Ptr = std::shared_ptr<ClockSource>;
    using TimePoint = std::chrono::system_clock::time_point;
    using Now = std::function<TimePoint()>;

    enum class Precision {
        Days,
        Hours,
        Minutes,
        Seconds,
    };

    // `now` defaults to system_clock::now
    static Result<Ptr> create(std::string format, Precision precision, Now now = {}) noexcept;

    static std::optional<Precision> precisionFromName(const std::string& name);

    // Time from `local` (+ `millis` into the current second) to the next boundary
    static std::chrono::milliseconds untilNextBoundary(Precision precision, const std::tm& local, int millis);

    Result<std::string> format(TimePoint when) const;

    Result<std::optional<ContentItem>> next(SourceContext& ctx) override;

private:
    ClockSource(std::string format, Precision precision, Now now) noexcept;

    std::string _format;
    Precision _precision;
    Now _now;
    bool _started = false;
};

} // namespace lazybar
