//=============================================================================
// Config Tests
//=============================================================================

#include <boost/ut.hpp>
#include <lazybar/config.h>
#include <cstdio>
#include <fstream>
#include <unistd.h>

using namespace boost::ut;
using namespace lazybar;

suite config_tests = [] {
    "empty document yields defaults"_test = [] {
        auto cfg = ConfigLoader::parse("");
        expect(cfg.has_value()) << error_msg(cfg);
        expect(cfg->dock.edge == Edge::Top);
        expect(cfg->dock.height == 24_i);
        expect(cfg->fontSize == 14_i);
        expect(cfg->background == Color::rgba(0x20, 0x20, 0x20));
        expect(cfg->fullRepaintFraction == 0.5_d);
        expect(cfg->backoffBase.count() == 500_i);
        expect(cfg->errorText == "!");
        expect(cfg->widgets.empty());
    };

    "full document"_test = [] {
        auto cfg = ConfigLoader::parse(R"(
bar:
  position: bottom
  height: 30
  x: 1920
  width: 1280
  margin: 2
  name: mybar
font:
  path: /tmp/font.ttf
  size: 16
colors:
  background: "#102030"
  foreground: "#abc"
render:
  full-repaint-fraction: 0.8
  tick-ms: 250
  padding: 6
adapter:
  backoff-base-ms: 100
  backoff-max-ms: 1000
  grace-ms: 500
placeholders:
  error: "ERR"
  unavailable: "n/a"
widgets:
  end:
    - id: vol
      type: command
      command: pamixer --get-volume
      interval: 5
      priority: 2
      foreground: "#ff0000"
      on-click:
        left: pamixer -t
        scroll-up: pamixer -i 5
  start:
    - id: clock
      type: clock
      format: "%H:%M"
      precision: seconds
)");
        expect(cfg.has_value()) << error_msg(cfg);
        expect(cfg->dock.edge == Edge::Bottom);
        expect(cfg->dock.height == 30_i);
        expect(cfg->dock.x == 1920_i);
        expect(cfg->dock.width == 1280_i);
        expect(cfg->dock.margin == 2_i);
        expect(cfg->dock.name == "mybar");
        expect(cfg->fontPath == "/tmp/font.ttf");
        expect(cfg->fontSize == 16_i);
        expect(cfg->background == Color::rgba(0x10, 0x20, 0x30));
        expect(cfg->foreground == Color::rgba(0xAA, 0xBB, 0xCC));
        expect(cfg->tickMs == 250_i);
        expect(cfg->padding == 6_i);
        expect(cfg->grace.count() == 500_i);
        expect(cfg->unavailableText == "n/a");

        expect(cfg->widgets.size() == 2_u);
        const auto& clock = cfg->widgets[0];
        expect(clock.id == "clock") << "start zone widgets come first";
        expect(clock.zone == Zone::Start);
        expect(clock.format == "%H:%M");
        expect(clock.precision == "seconds");

        const auto& vol = cfg->widgets[1];
        expect(vol.zone == Zone::End);
        expect(vol.priority == 2_i);
        expect(vol.interval == 5_i);
        expect(vol.attrs.fg == std::optional<Color>(Color::rgba(0xFF, 0, 0)));
        expect(!vol.attrs.bg.has_value());
        expect(vol.onClick.size() == 2_u);
        expect(vol.onClick.at(Button::Left) == "pamixer -t");
        expect(vol.onClick.at(Button::ScrollUp) == "pamixer -i 5");
    };

    "clock format defaults follow the precision"_test = [] {
        auto cfg = ConfigLoader::parse(R"(
widgets:
  start:
    - {id: a, type: clock}
    - {id: b, type: clock, precision: seconds}
    - {id: c, type: clock, precision: days}
)");
        expect(cfg.has_value()) << error_msg(cfg);
        expect(cfg->widgets[0].format == "%Y-%m-%d %H:%M");
        expect(cfg->widgets[1].format == "%Y-%m-%d %T");
        expect(cfg->widgets[2].format == "%Y-%m-%d");
    };

    "validation errors"_test = [] {
        const char* bad[] = {
            "bar: {height: 0}",
            "bar: {position: left}",
            "colors: {background: '#12'}",
            "colors: {foreground: red}",
            "render: {full-repaint-fraction: 1.5}",
            "adapter: {backoff-base-ms: 100, backoff-max-ms: 50}",
            "widgets: {start: [{id: a, type: weather}]}",
            "widgets: {start: [{type: clock}]}",
            "widgets: {start: [{id: a, type: clock}], end: [{id: a, type: clock}]}",
            "widgets: {start: [{id: a, type: command}]}",
            "widgets: {start: [{id: a, type: command, command: ls, on-click: {double: ls}}]}",
            "widgets: {start: [{id: a, type: clock, precision: weeks}]}",
            "widgets: {left: []}",
            "widgets: {start: [{id: a, type: command, command: ls, interval: -1}]}",
            "bar: [1, 2]",
            "- just a list",
        };
        for (const char* text : bad) {
            auto cfg = ConfigLoader::parse(text);
            expect(!cfg.has_value()) << "accepted: " << text;
        }
    };

    "malformed yaml is an error"_test = [] {
        expect(!ConfigLoader::parse("bar: {height: [").has_value());
    };

    "merge overrides nested keys"_test = [] {
        YAML::Node base = YAML::Load("bar: {height: 24, position: top}\nfont: {size: 12}");
        YAML::Node over = YAML::Load("bar: {position: bottom}");
        ConfigLoader::merge(base, over);
        expect(base["bar"]["position"].as<std::string>() == "bottom");
        expect(base["bar"]["height"].as<int>() == 24_i);
        expect(base["font"]["size"].as<int>() == 12_i);
    };

    "environment overrides"_test = [] {
        YAML::Node root = YAML::Load("bar: {height: 24}");
        ConfigLoader::applyEnvOverrides(root, {
            "LAZYBAR_BAR_HEIGHT=30",
            "LAZYBAR_RENDER_FULL_REPAINT_FRACTION=0.9",
            "LAZYBAR_UNKNOWN_KEY=1",
            "PATH=/usr/bin",
        });
        auto cfg = ConfigLoader::fromYaml(root);
        expect(cfg.has_value()) << error_msg(cfg);
        expect(cfg->dock.height == 30_i);
        expect(cfg->fullRepaintFraction == 0.9_d);
        expect(!root["unknown"]);
    };

    "load: explicit missing file is an error"_test = [] {
        auto cfg = ConfigLoader::load("/nonexistent/lazybar/config.yaml");
        expect(!cfg.has_value());
    };

    "load: file plus command line overrides"_test = [] {
        char path[] = "/tmp/lazybar-config-XXXXXX";
        int fd = mkstemp(path);
        expect(fd >= 0);
        close(fd);
        {
            std::ofstream out(path);
            out << "bar: {height: 28}\nwidgets: {end: [{id: clock, type: clock}]}\n";
        }

        YAML::Node overrides;
        overrides["bar"]["position"] = "bottom";
        auto cfg = ConfigLoader::load(path, overrides);
        std::remove(path);

        expect(cfg.has_value()) << error_msg(cfg);
        expect(cfg->dock.height == 28_i);
        expect(cfg->dock.edge == Edge::Bottom);
        expect(cfg->widgets.size() == 1_u);
    };

    "default path honours XDG_CONFIG_HOME"_test = [] {
        const char* saved = std::getenv("XDG_CONFIG_HOME");
        std::string restore = saved ? saved : "";
        setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
        expect(ConfigLoader::defaultPath() == std::filesystem::path("/tmp/xdg-test/lazybar/config.yaml"));
        if (saved) {
            setenv("XDG_CONFIG_HOME", restore.c_str(), 1);
        } else {
            unsetenv("XDG_CONFIG_HOME");
        }
    };
};
