#pragma once

#include <lazybar/bus-event.h>
#include <lazybar/content.h>
#include <lazybar/render-frame.h>
#include <memory>
#include <unordered_map>
#include <vector>

namespace lazybar {

//-----------------------------------------------------------------------------
// ClickRouter - pointer press -> click region -> action for its widget
//
// Holds the regions of the current frame only; setFrame() replaces them
// wholesale. Runs on the bar thread.
//-----------------------------------------------------------------------------
class ClickRouter {
public:
    enum class Outcome {
        Delivered,
        Released,   // releases are never routed
        NoRegion,
        Unbound,    // region exists, button has no action
        NoTarget,   // widget has no live adapter
    };

    void addTarget(WidgetId id, std::weak_ptr<ActionTarget> target);
    void setFrame(const RenderFrame::Ptr& frame);

    Outcome route(const PointerButton& event);

    // Binary search over regions sorted by x; nullptr when (x, y) hits none
    static const ClickRegion* findRegion(const std::vector<ClickRegion>& regions, int x, int y);

    uint64_t delivered() const { return _delivered; }

private:
    RenderFrame::Ptr _frame;
    std::unordered_map<WidgetId, std::weak_ptr<ActionTarget>> _targets;
    uint64_t _delivered = 0;
};

const char* outcomeName(ClickRouter::Outcome outcome);

} // namespace lazybar
