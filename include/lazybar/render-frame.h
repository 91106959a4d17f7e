#pragma once

#include <lazybar/content.h>
#include <lazybar/geometry.h>
#include <lazybar/layout-engine.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace lazybar {

// A run placed on the bar; `run.box` and glyph x are in bar coordinates and
// `clip` is the owning widget's rectangle
struct PlacedRun {
    WidgetId widget = NoWidgetId;
    Rect clip;
    Run run;
};

struct ClickRegion {
    Rect rect;
    WidgetId widget = NoWidgetId;
    ClickBindings bindings;
};

//-----------------------------------------------------------------------------
// RenderFrame - complete paintable description of the bar
//
// Immutable once published; consumers hold it through Ptr. Regions are sorted
// by x and never overlap.
//-----------------------------------------------------------------------------
struct RenderFrame {
    using Ptr = std::shared_ptr<const RenderFrame>;

    uint64_t generation = 0;
    int width = 0;
    int height = 0;
    Color background;
    std::vector<PlacedRun> runs;
    std::vector<ClickRegion> regions;
};

//-----------------------------------------------------------------------------
// RepaintRequest - what the surface must repaint
//-----------------------------------------------------------------------------
struct RepaintRequest {
    bool full = false;
    Rect damage;  // ignored when full

    bool empty() const { return !full && damage.empty(); }

    void merge(const RepaintRequest& other) {
        full = full || other.full;
        damage = damage.united(other.damage);
    }

    bool operator==(const RepaintRequest&) const = default;
};

} // namespace lazybar
