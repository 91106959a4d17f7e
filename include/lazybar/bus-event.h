#pragma once

//=============================================================================
// Bus events - everything the bar thread reacts to, in one closed set
//=============================================================================

#include <lazybar/content.h>
#include <lazybar/geometry.h>
#include <lazybar/layout-engine.h>
#include <cstdint>
#include <memory>
#include <variant>

namespace lazybar {

// New laid-out content for one widget
struct WidgetUpdated {
    WidgetId id = NoWidgetId;
    LayoutResult layout;
    uint64_t sequence = 0;  // per-widget emission counter, starts at 1
};

// Pointer press or release, bar-local coordinates
struct PointerButton {
    int x = 0;
    int y = 0;
    Button button = Button::Left;
    bool pressed = true;
};

// Part of the window needs repainting from the current frame
struct Exposed {
    Rect rect;
};

// The window manager changed the bar geometry
struct Configured {
    int width = 0;
    int height = 0;
};

// Periodic heartbeat
struct Tick {
    uint64_t count = 0;
};

using DisplayEvent = std::variant<PointerButton, Exposed, Configured>;
using BusEvent = std::variant<WidgetUpdated, PointerButton, Exposed, Configured, Tick>;

//-----------------------------------------------------------------------------
// UpdateSink - where an adapter publishes; safe to call from any thread.
// A newer update replaces the pending one of the same widget.
//-----------------------------------------------------------------------------
class UpdateSink {
public:
    using Ptr = std::shared_ptr<UpdateSink>;

    virtual ~UpdateSink() = default;
    virtual void publish(WidgetUpdated update) = 0;
};

inline BusEvent toBusEvent(const DisplayEvent& event) {
    return std::visit([](const auto& e) -> BusEvent { return e; }, event);
}

} // namespace lazybar
