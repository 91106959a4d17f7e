//=============================================================================
// lazybar - docked status bar for X11
//
// Main entry point. Parses the command line, loads the configuration,
// docks the bar and runs it until SIGINT/SIGTERM.
//=============================================================================

#include <lazybar/bar.h>
#include <lazybar/config.h>
#include <lazybar/font/freetype-face.h>
#include <lazybar/x11/xcb-display.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <args.hxx>
#include <filesystem>
#include <iostream>
#include <string>

using namespace lazybar;

namespace {

struct CommandLine {
    std::string configPath;
    YAML::Node overrides;
};

// Err("Help requested") when -h was given
Result<CommandLine> parseArgs(int argc, char* argv[]) {
    args::ArgumentParser parser("lazybar - docked status bar for X11");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> configFile(parser, "path", "Config file path", {'c', "config"});
    args::ValueFlag<std::string> fontPath(parser, "font", "Path to TTF font", {'f', "font"});
    args::Flag bottom(parser, "bottom", "Dock at the bottom screen edge", {'b', "bottom"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return Err<CommandLine>("Help requested");
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return Err<CommandLine>(std::string("Parse error: ") + e.what());
    }

    CommandLine cmd;
    cmd.configPath = configFile ? args::get(configFile) : "";
    if (fontPath) {
        cmd.overrides["font"]["path"] = args::get(fontPath);
    }
    if (bottom) {
        cmd.overrides["bar"]["position"] = "bottom";
    }
    return Ok(cmd);
}

Result<FontFace::Ptr> openFont(const BarConfig& config) {
    if (!config.fontPath.empty()) {
        auto face = FreeTypeFace::create(config.fontPath, uint32_t(config.fontSize));
        if (!face) {
            return Err<FontFace::Ptr>("cannot open font " + config.fontPath, face);
        }
        return Ok(FontFace::Ptr(*face));
    }
    for (const auto& path : FreeTypeFace::defaultFontPaths()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;
        auto face = FreeTypeFace::create(path, uint32_t(config.fontSize));
        if (face) {
            yinfo("Using font {}", path);
            return Ok(FontFace::Ptr(*face));
        }
        ywarn("Skipping font {}: {}", path, error_msg(face));
    }
    return Err<FontFace::Ptr>("no usable font found; set font.path or pass --font");
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();

    auto cmd = parseArgs(argc, argv);
    if (!cmd) {
        if (cmd.error().message() == "Help requested") {
            return 0;
        }
        return 1;
    }

    auto config = ConfigLoader::load(cmd->configPath, cmd->overrides);
    if (!config) {
        yerror("Invalid configuration: {}", error_msg(config));
        return 1;
    }

    auto face = openFont(*config);
    if (!face) {
        yerror("{}", error_msg(face));
        return 1;
    }

    auto display = XcbDisplay::create(config->dock);
    if (!display) {
        yerror("Failed to dock bar: {}", error_msg(display));
        return 1;
    }

    auto bar = Bar::create(*config, *display, *face);
    if (!bar) {
        yerror("Failed to initialize lazybar: {}", error_msg(bar));
        if (auto res = (*display)->teardown(); !res) {
            ywarn("Display teardown failed: {}", error_msg(res));
        }
        return 1;
    }

    if (auto res = (*bar)->run(); !res) {
        yerror("lazybar failed: {}", error_msg(res));
        return 1;
    }
    return 0;
}
