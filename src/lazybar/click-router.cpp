#include <lazybar/click-router.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace lazybar {

void ClickRouter::addTarget(WidgetId id, std::weak_ptr<ActionTarget> target) {
    _targets[id] = std::move(target);
}

void ClickRouter::setFrame(const RenderFrame::Ptr& frame) {
    _frame = frame;
}

const ClickRegion* ClickRouter::findRegion(const std::vector<ClickRegion>& regions, int x, int y) {
    // First region starting right of x; the candidate is the one before it
    auto it = std::upper_bound(regions.begin(), regions.end(), x,
                               [](int px, const ClickRegion& r) { return px < r.rect.x; });
    if (it == regions.begin()) {
        return nullptr;
    }
    --it;
    return it->rect.contains(x, y) ? &*it : nullptr;
}

ClickRouter::Outcome ClickRouter::route(const PointerButton& event) {
    if (!event.pressed) {
        return Outcome::Released;
    }
    if (!_frame) {
        return Outcome::NoRegion;
    }

    const ClickRegion* region = findRegion(_frame->regions, event.x, event.y);
    if (!region) {
        return Outcome::NoRegion;
    }

    const Action* action = region->bindings.find(event.button);
    if (!action) {
        return Outcome::Unbound;
    }

    auto it = _targets.find(region->widget);
    if (it == _targets.end()) {
        return Outcome::NoTarget;
    }
    auto target = it->second.lock();
    if (!target) {
        return Outcome::NoTarget;
    }

    ydebug("ClickRouter: {} at ({}, {}) -> widget {} action '{}'",
           buttonName(event.button), event.x, event.y, region->widget, action->name);
    target->deliver(*action);
    _delivered++;
    return Outcome::Delivered;
}

const char* outcomeName(ClickRouter::Outcome outcome) {
    switch (outcome) {
        case ClickRouter::Outcome::Delivered: return "delivered";
        case ClickRouter::Outcome::Released:  return "released";
        case ClickRouter::Outcome::NoRegion:  return "no-region";
        case ClickRouter::Outcome::Unbound:   return "unbound";
        case ClickRouter::Outcome::NoTarget:  return "no-target";
    }
    return "?";
}

} // namespace lazybar
