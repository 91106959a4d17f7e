#include <lazybar/config.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>

extern char** environ;

namespace lazybar {

namespace {

const char* const kSections[] = {"bar", "font", "colors", "render", "adapter", "placeholders"};

// Built-in configuration used when no config file exists
const char* const kDefaultConfig = R"(
widgets:
  end:
    - id: clock
      type: clock
)";

const char* defaultClockFormat(const std::string& precision) {
    if (precision == "days") return "%Y-%m-%d";
    if (precision == "hours") return "%Y-%m-%d %H";
    if (precision == "seconds") return "%Y-%m-%d %T";
    return "%Y-%m-%d %H:%M";
}

template<typename T>
T valueOr(const YAML::Node& section, const char* key, const T& fallback) {
    if (!section || !section[key]) return fallback;
    return section[key].as<T>();
}

Result<Color> colorOr(const YAML::Node& section, const char* key, Color fallback) {
    if (!section || !section[key]) return Ok(fallback);
    std::string text = section[key].as<std::string>();
    auto color = Color::parse(text);
    if (!color) {
        return Err<Color>(std::string("invalid color for '") + key + "': '" + text + "'");
    }
    return Ok(*color);
}

Result<std::optional<Color>> optionalColor(const YAML::Node& node, const char* key) {
    if (!node[key]) return Ok(std::optional<Color>());
    std::string text = node[key].as<std::string>();
    auto color = Color::parse(text);
    if (!color) {
        return Err<std::optional<Color>>(std::string("invalid color for '") + key + "': '" + text + "'");
    }
    return Ok(std::optional<Color>(*color));
}

//-----------------------------------------------------------------------------
// Sections
//-----------------------------------------------------------------------------

Result<void> parseBar(const YAML::Node& bar, BarConfig& cfg) {
    std::string position = valueOr<std::string>(bar, "position", "top");
    if (position == "top") {
        cfg.dock.edge = Edge::Top;
    } else if (position == "bottom") {
        cfg.dock.edge = Edge::Bottom;
    } else {
        return Err<void>("bar.position must be 'top' or 'bottom', got '" + position + "'");
    }

    cfg.dock.height = valueOr<int>(bar, "height", 24);
    cfg.dock.x = valueOr<int>(bar, "x", 0);
    cfg.dock.width = valueOr<int>(bar, "width", 0);
    cfg.dock.margin = valueOr<int>(bar, "margin", 0);
    cfg.dock.name = valueOr<std::string>(bar, "name", "lazybar");

    if (cfg.dock.height <= 0) return Err<void>("bar.height must be positive");
    if (cfg.dock.x < 0) return Err<void>("bar.x must not be negative");
    if (cfg.dock.width < 0) return Err<void>("bar.width must not be negative");
    if (cfg.dock.margin < 0) return Err<void>("bar.margin must not be negative");
    return Ok();
}

Result<void> parseRendering(const YAML::Node& root, BarConfig& cfg) {
    const YAML::Node font = root["font"];
    cfg.fontPath = valueOr<std::string>(font, "path", "");
    cfg.fontSize = valueOr<int>(font, "size", 14);
    if (cfg.fontSize <= 0) return Err<void>("font.size must be positive");

    const YAML::Node colors = root["colors"];
    auto bg = colorOr(colors, "background", cfg.background);
    if (!bg) return Err<void>("colors", bg);
    cfg.background = *bg;
    auto fg = colorOr(colors, "foreground", cfg.foreground);
    if (!fg) return Err<void>("colors", fg);
    cfg.foreground = *fg;

    const YAML::Node render = root["render"];
    cfg.fullRepaintFraction = valueOr<double>(render, "full-repaint-fraction", 0.5);
    cfg.tickMs = valueOr<int>(render, "tick-ms", 1000);
    cfg.padding = valueOr<int>(render, "padding", 4);
    if (cfg.fullRepaintFraction < 0.0 || cfg.fullRepaintFraction > 1.0) {
        return Err<void>("render.full-repaint-fraction must be within [0, 1]");
    }
    if (cfg.tickMs < 0) return Err<void>("render.tick-ms must not be negative");
    if (cfg.padding < 0) return Err<void>("render.padding must not be negative");
    return Ok();
}

Result<void> parseAdapter(const YAML::Node& root, BarConfig& cfg) {
    const YAML::Node adapter = root["adapter"];
    cfg.backoffBase = std::chrono::milliseconds(valueOr<int>(adapter, "backoff-base-ms", 500));
    cfg.backoffMax = std::chrono::milliseconds(valueOr<int>(adapter, "backoff-max-ms", 30000));
    cfg.grace = std::chrono::milliseconds(valueOr<int>(adapter, "grace-ms", 2000));
    if (cfg.backoffBase.count() <= 0) return Err<void>("adapter.backoff-base-ms must be positive");
    if (cfg.backoffMax < cfg.backoffBase) return Err<void>("adapter.backoff-max-ms must be >= backoff-base-ms");
    if (cfg.grace.count() < 0) return Err<void>("adapter.grace-ms must not be negative");

    const YAML::Node placeholders = root["placeholders"];
    cfg.errorText = valueOr<std::string>(placeholders, "error", "!");
    cfg.unavailableText = valueOr<std::string>(placeholders, "unavailable", "-");
    return Ok();
}

Result<WidgetConfig> parseWidget(const YAML::Node& node, Zone zone) {
    if (!node.IsMap()) {
        return Err<WidgetConfig>("widget entry must be a map");
    }

    WidgetConfig w;
    w.zone = zone;
    w.id = valueOr<std::string>(node, "id", "");
    w.type = valueOr<std::string>(node, "type", "");
    w.priority = valueOr<int>(node, "priority", 0);

    if (w.id.empty()) {
        return Err<WidgetConfig>("widget without id");
    }

    auto fg = optionalColor(node, "foreground");
    if (!fg) return Err<WidgetConfig>("widget '" + w.id + "'", fg);
    auto bg = optionalColor(node, "background");
    if (!bg) return Err<WidgetConfig>("widget '" + w.id + "'", bg);
    w.attrs.fg = *fg;
    w.attrs.bg = *bg;

    if (const YAML::Node clicks = node["on-click"]) {
        if (!clicks.IsMap()) {
            return Err<WidgetConfig>("widget '" + w.id + "': on-click must be a map");
        }
        for (auto it = clicks.begin(); it != clicks.end(); ++it) {
            std::string name = it->first.as<std::string>();
            auto button = buttonFromName(name);
            if (!button) {
                return Err<WidgetConfig>("widget '" + w.id + "': unknown button '" + name + "'");
            }
            w.onClick[*button] = it->second.as<std::string>();
        }
    }

    if (w.type == "clock") {
        w.precision = valueOr<std::string>(node, "precision", "minutes");
        static const std::set<std::string> precisions = {"days", "hours", "minutes", "seconds"};
        if (!precisions.count(w.precision)) {
            return Err<WidgetConfig>("widget '" + w.id + "': unknown precision '" + w.precision + "'");
        }
        w.format = valueOr<std::string>(node, "format", defaultClockFormat(w.precision));
    } else if (w.type == "command") {
        w.command = valueOr<std::string>(node, "command", "");
        w.interval = valueOr<int>(node, "interval", 0);
        if (w.command.empty()) {
            return Err<WidgetConfig>("widget '" + w.id + "': command is required");
        }
        if (w.interval < 0) {
            return Err<WidgetConfig>("widget '" + w.id + "': interval must not be negative");
        }
    } else {
        return Err<WidgetConfig>("widget '" + w.id + "': unknown type '" + w.type + "'");
    }
    return Ok(w);
}

Result<void> parseWidgets(const YAML::Node& widgets, BarConfig& cfg) {
    if (!widgets) return Ok();
    if (!widgets.IsMap()) return Err<void>("widgets must be a map of zones");

    for (auto it = widgets.begin(); it != widgets.end(); ++it) {
        std::string zone = it->first.as<std::string>();
        if (zone != "start" && zone != "center" && zone != "end") {
            return Err<void>("unknown zone '" + zone + "' (expected start, center or end)");
        }
    }

    std::set<std::string> ids;
    for (Zone zone : {Zone::Start, Zone::Center, Zone::End}) {
        const YAML::Node list = widgets[zoneName(zone)];
        if (!list) continue;
        if (!list.IsSequence()) {
            return Err<void>(std::string("widgets.") + zoneName(zone) + " must be a list");
        }
        for (const auto& item : list) {
            auto w = parseWidget(item, zone);
            if (!w) return Err<void>(std::string("widgets.") + zoneName(zone), w);
            if (!ids.insert(w->id).second) {
                return Err<void>("duplicate widget id '" + w->id + "'");
            }
            cfg.widgets.push_back(std::move(*w));
        }
    }
    return Ok();
}

std::string envKey(const std::string& raw) {
    std::string out;
    for (char c : raw) {
        out += c == '_' ? '-' : char(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

//=============================================================================
// ConfigLoader
//=============================================================================

std::filesystem::path ConfigLoader::defaultPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        configDir = std::filesystem::path(home ? home : "/tmp") / ".config";
    }
    return configDir / "lazybar" / "config.yaml";
}

void ConfigLoader::merge(YAML::Node& base, const YAML::Node& over) {
    if (!over || over.IsNull()) return;
    if (!over.IsMap() || !base.IsMap()) {
        base = YAML::Clone(over);
        return;
    }
    for (auto it = over.begin(); it != over.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        YAML::Node child = base[key];
        if (child.IsMap() && it->second.IsMap()) {
            merge(child, it->second);
        } else {
            base[key] = YAML::Clone(it->second);
        }
    }
}

void ConfigLoader::applyEnvOverrides(YAML::Node& root, const std::vector<std::string>& environment) {
    const std::string prefix = ENV_PREFIX;
    for (const auto& entry : environment) {
        if (entry.compare(0, prefix.size(), prefix) != 0) continue;
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;

        std::string name = entry.substr(prefix.size(), eq - prefix.size());
        std::string value = entry.substr(eq + 1);

        for (const char* section : kSections) {
            std::string sectionPrefix = section;
            std::transform(sectionPrefix.begin(), sectionPrefix.end(), sectionPrefix.begin(), ::toupper);
            sectionPrefix += '_';
            if (name.size() <= sectionPrefix.size() || name.compare(0, sectionPrefix.size(), sectionPrefix) != 0) {
                continue;
            }
            std::string key = envKey(name.substr(sectionPrefix.size()));
            root[section][key] = value;
            ydebug("Config override from env: {}.{}={}", section, key, value);
            break;
        }
    }
}

Result<BarConfig> ConfigLoader::fromYaml(const YAML::Node& root) {
    BarConfig cfg;
    try {
        if (root && !root.IsNull() && !root.IsMap()) {
            return Err<BarConfig>("config root must be a map");
        }
        for (const char* section : kSections) {
            const YAML::Node node = root[section];
            if (node && !node.IsNull() && !node.IsMap()) {
                return Err<BarConfig>(std::string("section '") + section + "' must be a map");
            }
        }
        if (auto res = parseBar(root["bar"], cfg); !res) return Err<BarConfig>("bar", res);
        if (auto res = parseRendering(root, cfg); !res) return Err<BarConfig>("rendering", res);
        if (auto res = parseAdapter(root, cfg); !res) return Err<BarConfig>("adapter", res);
        if (auto res = parseWidgets(root["widgets"], cfg); !res) return Err<BarConfig>("widgets", res);
    } catch (const YAML::Exception& e) {
        return Err<BarConfig>("YAML error: " + std::string(e.what()));
    }
    return Ok(cfg);
}

Result<BarConfig> ConfigLoader::parse(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Err<BarConfig>("YAML parse error: " + std::string(e.what()));
    }
    return fromYaml(root);
}

Result<BarConfig> ConfigLoader::load(const std::string& path, const YAML::Node& overrides) {
    std::string effectivePath = path;
    bool explicitPath = !path.empty();
    if (!explicitPath) {
        effectivePath = defaultPath().string();
    }

    YAML::Node root;
    try {
        std::ifstream file(effectivePath);
        if (file.is_open()) {
            root = YAML::Load(file);
            yinfo("Loaded config from: {}", effectivePath);
        } else if (explicitPath) {
            return Err<BarConfig>("Cannot open config file: " + effectivePath);
        } else {
            yinfo("No config at {}, using built-in defaults", effectivePath);
            root = YAML::Load(kDefaultConfig);
        }

        if (!root || root.IsNull()) {
            root = YAML::Node(YAML::NodeType::Map);
        }
        merge(root, overrides);

        std::vector<std::string> environment;
        for (char** env = environ; env && *env; ++env) {
            environment.emplace_back(*env);
        }
        applyEnvOverrides(root, environment);
    } catch (const YAML::Exception& e) {
        return Err<BarConfig>("YAML parse error in " + effectivePath + ": " + std::string(e.what()));
    }

    auto cfg = fromYaml(root);
    if (!cfg) {
        return Err<BarConfig>("Invalid config " + effectivePath, cfg);
    }
    return cfg;
}

} // namespace lazybar
