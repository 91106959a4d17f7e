#pragma once

#include <lazybar/geometry.h>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lazybar {

using WidgetId = uint32_t;

static constexpr WidgetId NoWidgetId = UINT32_MAX;

//-----------------------------------------------------------------------------
// Alignment zones, in elision order (center is elided first)
//-----------------------------------------------------------------------------
enum class Zone : uint8_t {
    Start,
    Center,
    End,
};

static constexpr size_t ZoneCount = 3;

const char* zoneName(Zone zone);

//-----------------------------------------------------------------------------
// Pointer buttons, numbered like X11 (1 = left ... 5 = scroll down)
//-----------------------------------------------------------------------------
enum class Button : uint8_t {
    Left = 1,
    Middle = 2,
    Right = 3,
    ScrollUp = 4,
    ScrollDown = 5,
};

static constexpr size_t ButtonCount = 5;

std::optional<Button> buttonFromX11(uint8_t detail);
std::optional<Button> buttonFromName(const std::string& name);
const char* buttonName(Button button);

//-----------------------------------------------------------------------------
// Action - what a click asks a widget source to do. Plain data; it carries no
// reference back to the source.
//-----------------------------------------------------------------------------
struct Action {
    std::string name;
    std::string payload;

    bool operator==(const Action&) const = default;
};

// Whoever executes actions for a widget
class ActionTarget {
public:
    using Ptr = std::shared_ptr<ActionTarget>;

    virtual ~ActionTarget() = default;
    virtual void deliver(const Action& action) = 0;
};

//-----------------------------------------------------------------------------
// ClickBindings - fixed capability descriptor: one optional action per button
//-----------------------------------------------------------------------------
class ClickBindings {
public:
    void bind(Button button, Action action) { _actions[index(button)] = std::move(action); }
    void unbind(Button button) { _actions[index(button)].reset(); }

    const Action* find(Button button) const {
        const auto& slot = _actions[index(button)];
        return slot ? &*slot : nullptr;
    }

    bool supports(Button button) const { return _actions[index(button)].has_value(); }

    bool empty() const {
        for (const auto& a : _actions) {
            if (a) return false;
        }
        return true;
    }

    bool operator==(const ClickBindings&) const = default;

private:
    static size_t index(Button b) { return static_cast<size_t>(b) - 1; }

    std::array<std::optional<Action>, ButtonCount> _actions;
};

//-----------------------------------------------------------------------------
// Segment - one piece of content with its colors
//
// Text:  UTF-8 text
// Icon:  a single codepoint (icon fonts)
// Meter: a fraction bar `width` pixels wide, filled to `fraction`
// Gap:   `width` pixels of background
//-----------------------------------------------------------------------------
struct Segment {
    enum class Kind : uint8_t {
        Text,
        Icon,
        Meter,
        Gap,
    };

    Kind kind = Kind::Text;
    std::string text;
    uint32_t icon = 0;
    int width = 0;
    float fraction = 0.0f;
    std::optional<Color> fg;  // unset = widget default
    std::optional<Color> bg;

    static Segment makeText(std::string text, std::optional<Color> fg = {}, std::optional<Color> bg = {}) {
        Segment s;
        s.kind = Kind::Text;
        s.text = std::move(text);
        s.fg = fg;
        s.bg = bg;
        return s;
    }

    static Segment makeIcon(uint32_t codepoint, std::optional<Color> fg = {}, std::optional<Color> bg = {}) {
        Segment s;
        s.kind = Kind::Icon;
        s.icon = codepoint;
        s.fg = fg;
        s.bg = bg;
        return s;
    }

    static Segment makeMeter(int width, float fraction, std::optional<Color> fg = {}, std::optional<Color> bg = {}) {
        Segment s;
        s.kind = Kind::Meter;
        s.width = width;
        s.fraction = fraction;
        s.fg = fg;
        s.bg = bg;
        return s;
    }

    static Segment makeGap(int width) {
        Segment s;
        s.kind = Kind::Gap;
        s.width = width;
        return s;
    }

    bool operator==(const Segment&) const = default;
};

//-----------------------------------------------------------------------------
// ContentItem - one update emitted by a widget source
//-----------------------------------------------------------------------------
struct ContentItem {
    std::vector<Segment> segments;

    static ContentItem text(std::string text) {
        ContentItem item;
        item.segments.push_back(Segment::makeText(std::move(text)));
        return item;
    }

    bool operator==(const ContentItem&) const = default;
};

//-----------------------------------------------------------------------------
// Attrs - default colors for a widget; per-widget values overlay the global ones
//-----------------------------------------------------------------------------
struct Attrs {
    std::optional<Color> fg;
    std::optional<Color> bg;

    Attrs overlay(const Attrs& over) const {
        Attrs out = *this;
        if (over.fg) out.fg = over.fg;
        if (over.bg) out.bg = over.bg;
        return out;
    }

    bool operator==(const Attrs&) const = default;
};

} // namespace lazybar
