#pragma once

//=============================================================================
// PanelComposer
//
// Owns the widgets' current layouts, the zone layout and the one
// authoritative RenderFrame. Runs on the bar thread only.
//=============================================================================

#include <lazybar/bus-event.h>
#include <lazybar/content.h>
#include <lazybar/render-frame.h>
#include <lazybar/result.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lazybar {

struct WidgetSpec {
    WidgetId id = NoWidgetId;
    std::string name;
    Zone zone = Zone::Start;
    int priority = 0;  // lower is elided first
    ClickBindings bindings;
};

struct ZoneLayout {
    int x = 0;
    int width = 0;
};

class PanelComposer {
public:
    using Ptr = std::shared_ptr<PanelComposer>;

    struct Options {
        int width = 0;
        int height = 0;
        Color background;
        double fullRepaintFraction = 0.5;
    };

    static Result<Ptr> create(const Options& options, std::vector<WidgetSpec> widgets) noexcept;

    virtual ~PanelComposer() = default;

    // Apply new content for one widget. Returns what must be repainted, or
    // nullopt when nothing visible changed.
    virtual Result<std::optional<RepaintRequest>> apply(const WidgetUpdated& update) = 0;

    // Bar geometry changed: re-lay out everything, full repaint
    virtual std::optional<RepaintRequest> resize(int width, int height) = 0;

    virtual RenderFrame::Ptr frame() const = 0;

    virtual ZoneLayout zoneLayout(Zone zone) const = 0;

    // Placement in bar coordinates; nullopt when elided or unknown
    virtual std::optional<Rect> widgetRect(WidgetId id) const = 0;
    virtual bool isElided(WidgetId id) const = 0;

    // Ids elided in the current frame, in elision order
    virtual std::vector<WidgetId> elided() const = 0;

    virtual int width() const = 0;
    virtual int height() const = 0;

protected:
    PanelComposer() = default;
};

} // namespace lazybar
