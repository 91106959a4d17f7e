#pragma once

#include <lazybar/display.h>
#include <lazybar/result.hpp>
#include <memory>

namespace lazybar {

/**
 * XcbDisplay - docked bar window on an X11 server
 *
 * Connects with xcb, creates a window at the configured screen edge using a
 * 32-bit ARGB visual when the server has one, and advertises it as a dock
 * (_NET_WM_WINDOW_TYPE_DOCK, _NET_WM_STRUT, _NET_WM_STRUT_PARTIAL, sticky,
 * above, all desktops). Pixels are uploaded with PutImage per dirty
 * rectangle.
 */
class XcbDisplay : public DisplayConnection {
public:
    using Ptr = std::shared_ptr<XcbDisplay>;

    // `displayName` empty uses $DISPLAY
    static Result<Ptr> create(const DockOptions& options, const std::string& displayName = {}) noexcept;

    ~XcbDisplay() override = default;

    // Depth of the window visual (32 when an ARGB visual was found)
    virtual int depth() const = 0;

protected:
    XcbDisplay() = default;
};

} // namespace lazybar
