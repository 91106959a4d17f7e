#pragma once

#include <lazybar/config.h>
#include <lazybar/result.hpp>
#include <lazybar/widget-source.h>
#include <functional>

namespace lazybar {

// Builds the source for one configured widget
using SourceFactory = std::function<Result<WidgetSource::Ptr>(const WidgetConfig&)>;

// Built-in widget types: "clock" and "command"
Result<WidgetSource::Ptr> createSource(const WidgetConfig& config);

} // namespace lazybar
