#pragma once

#include <lazybar/content.h>
#include <lazybar/display.h>
#include <lazybar/geometry.h>
#include <lazybar/result.hpp>
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace lazybar {

//-----------------------------------------------------------------------------
// WidgetConfig - one entry of widgets.start / widgets.center / widgets.end
//-----------------------------------------------------------------------------
struct WidgetConfig {
    std::string id;
    std::string type;  // "clock" | "command"
    Zone zone = Zone::Start;
    int priority = 0;
    Attrs attrs;
    std::map<Button, std::string> onClick;  // button -> shell command

    // clock
    std::string format;
    std::string precision = "minutes";

    // command
    std::string command;
    int interval = 0;  // seconds; 0 runs once
};

//-----------------------------------------------------------------------------
// BarConfig - validated configuration handed to the engine
//-----------------------------------------------------------------------------
struct BarConfig {
    DockOptions dock;

    std::string fontPath;  // empty: first existing default font
    int fontSize = 14;

    Color background = Color::rgba(0x20, 0x20, 0x20);
    Color foreground = Color::rgba(0xFF, 0xFF, 0xFF);

    double fullRepaintFraction = 0.5;
    int tickMs = 1000;
    int padding = 4;

    std::chrono::milliseconds backoffBase{500};
    std::chrono::milliseconds backoffMax{30000};
    std::chrono::milliseconds grace{2000};

    std::string errorText = "!";
    std::string unavailableText = "-";

    // In configuration order: start zone, then center, then end
    std::vector<WidgetConfig> widgets;
};

class ConfigLoader {
public:
    // Environment variable prefix: LAZYBAR_<SECTION>_<KEY>, e.g.
    // LAZYBAR_BAR_HEIGHT=30 or LAZYBAR_RENDER_FULL_REPAINT_FRACTION=0.8
    static constexpr const char* ENV_PREFIX = "LAZYBAR_";

    // Load `path`, or the default path when empty. A missing default file
    // yields the built-in configuration; a missing explicit file is an error.
    // `overrides` (from the command line) is merged on top of the file, and
    // environment overrides on top of both.
    static Result<BarConfig> load(const std::string& path, const YAML::Node& overrides = YAML::Node());

    // Parse and validate a YAML document
    static Result<BarConfig> parse(const std::string& text);
    static Result<BarConfig> fromYaml(const YAML::Node& root);

    // $XDG_CONFIG_HOME/lazybar/config.yaml, else ~/.config/lazybar/config.yaml
    static std::filesystem::path defaultPath();

    // Recursively merge map `over` into `base`
    static void merge(YAML::Node& base, const YAML::Node& over);

    // Apply LAZYBAR_* variables from `environ`-style entries ("KEY=value")
    static void applyEnvOverrides(YAML::Node& root, const std::vector<std::string>& environment);
};

} // namespace lazybar
