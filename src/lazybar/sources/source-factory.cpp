#include <lazybar/sources/clock-source.h>
#include <lazybar/sources/command-source.h>
#include <lazybar/sources/source-factory.h>
#include <ytrace/ytrace.hpp>

namespace lazybar {

Result<WidgetSource::Ptr> createSource(const WidgetConfig& config) {
    if (config.type == "clock") {
        auto precision = ClockSource::precisionFromName(config.precision);
        if (!precision) {
            return Err<WidgetSource::Ptr>("widget '" + config.id + "': unknown clock precision '" +
                                          config.precision + "'");
        }
        auto clock = ClockSource::create(config.format, *precision);
        if (!clock) {
            return Err<WidgetSource::Ptr>("widget '" + config.id + "'", clock);
        }
        ydebug("createSource: clock '{}' format '{}'", config.id, config.format);
        return Ok(WidgetSource::Ptr(*clock));
    }

    if (config.type == "command") {
        CommandSource::Options options;
        options.command = config.command;
        options.interval = config.interval;
        options.onClick = config.onClick;
        auto command = CommandSource::create(options);
        if (!command) {
            return Err<WidgetSource::Ptr>("widget '" + config.id + "'", command);
        }
        ydebug("createSource: command '{}' runs '{}' every {}s", config.id, config.command, config.interval);
        return Ok(WidgetSource::Ptr(*command));
    }

    return Err<WidgetSource::Ptr>("widget '" + config.id + "': unknown type '" + config.type + "'");
}

} // namespace lazybar
