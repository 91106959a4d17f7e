#pragma once

#include <lazybar/result.hpp>
#include <lazybar/widget-source.h>
#include <chrono>
#include <map>
#include <string>

namespace lazybar {

/**
 * CommandSource - output of `sh -c <command>`
 *
 * Runs the command once, or every `interval` seconds. The first line of its
 * stdout, trimmed, is parsed as color markup and shown. A non-zero exit is a
 * transient error. Click bindings run their own shell command and then
 * refresh the content right away. Cancellation kills a running child.
 */
class CommandSource : public WidgetSource {
public:
    using Ptr = std::shared_ptr<CommandSource>;

    struct Options {
        std::string command;
        int interval = 0;  // seconds; 0 runs once
        std::map<Button, std::string> onClick;
    };

    static constexpr const char* ACTION_EXEC = "exec";

    static Result<Ptr> create(const Options& options) noexcept;

    Result<std::optional<ContentItem>> next(SourceContext& ctx) override;
    ClickBindings bindings() const override { return _bindings; }

    // Run `sh -c command` and collect its stdout. Err on spawn failure,
    // non-zero exit, death by signal or cancellation.
    static Result<std::string> run(const std::string& command, SourceContext& ctx);

    // First line of `output` without surrounding whitespace
    static std::string firstLine(const std::string& output);

private:
    explicit CommandSource(const Options& options) noexcept;

    Result<std::optional<ContentItem>> refresh(SourceContext& ctx);

    Options _options;
    ClickBindings _bindings;
    bool _started = false;
    std::chrono::steady_clock::time_point _nextRun;
};

} // namespace lazybar
