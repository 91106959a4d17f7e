#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lazybar {

//-----------------------------------------------------------------------------
// Rect - integer pixel rectangle, half-open [x, x+w) x [y, y+h)
//-----------------------------------------------------------------------------
struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    bool empty() const { return w <= 0 || h <= 0; }
    int right() const { return x + w; }
    int bottom() const { return y + h; }
    int64_t area() const { return empty() ? 0 : int64_t(w) * int64_t(h); }

    bool contains(int px, int py) const {
        return px >= x && px < right() && py >= y && py < bottom();
    }

    bool intersects(const Rect& o) const {
        return !empty() && !o.empty() &&
               x < o.right() && o.x < right() && y < o.bottom() && o.y < bottom();
    }

    Rect intersected(const Rect& o) const {
        int x1 = std::max(x, o.x);
        int y1 = std::max(y, o.y);
        int x2 = std::min(right(), o.right());
        int y2 = std::min(bottom(), o.bottom());
        if (x2 <= x1 || y2 <= y1) return {};
        return {x1, y1, x2 - x1, y2 - y1};
    }

    // Bounding union; an empty operand is ignored
    Rect united(const Rect& o) const {
        if (empty()) return o;
        if (o.empty()) return *this;
        int x1 = std::min(x, o.x);
        int y1 = std::min(y, o.y);
        int x2 = std::max(right(), o.right());
        int y2 = std::max(bottom(), o.bottom());
        return {x1, y1, x2 - x1, y2 - y1};
    }

    Rect translated(int dx, int dy) const { return {x + dx, y + dy, w, h}; }

    bool operator==(const Rect&) const = default;

    std::string toString() const {
        return std::to_string(w) + "x" + std::to_string(h) + "+" +
               std::to_string(x) + "+" + std::to_string(y);
    }
};

//-----------------------------------------------------------------------------
// Color - straight (non-premultiplied) 0xAARRGGBB
//-----------------------------------------------------------------------------
struct Color {
    uint32_t argb = 0xFF000000;

    constexpr Color() = default;
    constexpr explicit Color(uint32_t v) : argb(v) {}

    static constexpr Color rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF) {
        return Color((uint32_t(a) << 24) | (uint32_t(r) << 16) | (uint32_t(g) << 8) | uint32_t(b));
    }

    constexpr uint8_t a() const { return uint8_t(argb >> 24); }
    constexpr uint8_t r() const { return uint8_t(argb >> 16); }
    constexpr uint8_t g() const { return uint8_t(argb >> 8); }
    constexpr uint8_t b() const { return uint8_t(argb); }

    bool operator==(const Color&) const = default;

    // Accepts #rgb, #rrggbb, #rrggbbaa
    static std::optional<Color> parse(const std::string& text);
};

} // namespace lazybar
