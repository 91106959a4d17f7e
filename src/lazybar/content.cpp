#include <lazybar/content.h>
#include <cctype>

namespace lazybar {

const char* zoneName(Zone zone) {
    switch (zone) {
        case Zone::Start:  return "start";
        case Zone::Center: return "center";
        case Zone::End:    return "end";
    }
    return "?";
}

std::optional<Button> buttonFromX11(uint8_t detail) {
    if (detail >= 1 && detail <= ButtonCount) {
        return static_cast<Button>(detail);
    }
    return std::nullopt;
}

std::optional<Button> buttonFromName(const std::string& name) {
    if (name == "left") return Button::Left;
    if (name == "middle") return Button::Middle;
    if (name == "right") return Button::Right;
    if (name == "scroll-up") return Button::ScrollUp;
    if (name == "scroll-down") return Button::ScrollDown;
    return std::nullopt;
}

const char* buttonName(Button button) {
    switch (button) {
        case Button::Left:       return "left";
        case Button::Middle:     return "middle";
        case Button::Right:      return "right";
        case Button::ScrollUp:   return "scroll-up";
        case Button::ScrollDown: return "scroll-down";
    }
    return "?";
}

//-----------------------------------------------------------------------------
// Color parsing
//-----------------------------------------------------------------------------

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Color> Color::parse(const std::string& text) {
    if (text.size() < 2 || text[0] != '#') return std::nullopt;

    std::string hex = text.substr(1);
    for (char c : hex) {
        if (hexValue(c) < 0) return std::nullopt;
    }

    auto byteAt = [&](size_t i) {
        return uint8_t(hexValue(hex[i]) * 16 + hexValue(hex[i + 1]));
    };

    switch (hex.size()) {
        case 3: {
            auto expand = [&](size_t i) { return uint8_t(hexValue(hex[i]) * 17); };
            return Color::rgba(expand(0), expand(1), expand(2));
        }
        case 6:
            return Color::rgba(byteAt(0), byteAt(2), byteAt(4));
        case 8:
            return Color::rgba(byteAt(0), byteAt(2), byteAt(4), byteAt(6));
        default:
            return std::nullopt;
    }
}

} // namespace lazybar
