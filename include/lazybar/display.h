#pragma once

#include <lazybar/bus-event.h>
#include <lazybar/geometry.h>
#include <lazybar/render/pixel-buffer.h>
#include <lazybar/result.hpp>
#include <memory>
#include <string>
#include <vector>

namespace lazybar {

enum class Edge : uint8_t {
    Top,
    Bottom,
};

//-----------------------------------------------------------------------------
// DockOptions - where and how the bar window is placed
//-----------------------------------------------------------------------------
struct DockOptions {
    Edge edge = Edge::Top;
    int height = 24;
    int x = 0;       // output region offset on the screen
    int width = 0;   // 0 spans the screen from x
    int margin = 0;  // extra strut beyond the bar height
    std::string name = "lazybar";
};

//-----------------------------------------------------------------------------
// DisplayConnection - the only component that talks to the display server
//
// Every error returned here is a connection-level failure and fatal to the
// bar.
//-----------------------------------------------------------------------------
class DisplayConnection {
public:
    using Ptr = std::shared_ptr<DisplayConnection>;

    virtual ~DisplayConnection() = default;

    // Pollable descriptor of the connection
    virtual int fd() const = 0;

    // Window size in pixels
    virtual int width() const = 0;
    virtual int height() const = 0;

    // Non-blocking: append every event already received
    virtual Result<void> pollEvents(std::vector<DisplayEvent>& out) = 0;

    // Copy the given rectangles of `buffer` to the window and flush
    virtual Result<void> present(const PixelBuffer& buffer, const std::vector<Rect>& rects) = 0;

    // Connection still usable
    virtual Result<void> check() = 0;

    // Destroy the window and disconnect. Idempotent.
    virtual Result<void> teardown() = 0;
};

} // namespace lazybar
