#include <lazybar/x11/xcb-display.h>
#include <ytrace/ytrace.hpp>
#include <xcb/xcb.h>
#include <xcb/xproto.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace lazybar {

namespace {

enum AtomIndex {
    NET_WM_WINDOW_TYPE,
    NET_WM_WINDOW_TYPE_DOCK,
    NET_WM_DESKTOP,
    NET_WM_STRUT_PARTIAL,
    NET_WM_STRUT,
    NET_WM_STATE,
    NET_WM_STATE_STICKY,
    NET_WM_STATE_ABOVE,
    NET_WM_NAME,
    UTF8_STRING,
    ATOM_COUNT,
};

const char* const kAtomNames[ATOM_COUNT] = {
    "_NET_WM_WINDOW_TYPE",
    "_NET_WM_WINDOW_TYPE_DOCK",
    "_NET_WM_DESKTOP",
    "_NET_WM_STRUT_PARTIAL",
    "_NET_WM_STRUT",
    "_NET_WM_STATE",
    "_NET_WM_STATE_STICKY",
    "_NET_WM_STATE_ABOVE",
    "_NET_WM_NAME",
    "UTF8_STRING",
};

// ICCCM WM_HINTS: flags, input, initial_state, icon_pixmap, icon_window,
// icon_x, icon_y, icon_mask, window_group
constexpr uint32_t kWmHintsInputHint = 1;
constexpr size_t kWmHintsLength = 9;

} // namespace

//=============================================================================
// XcbDisplayImpl
//=============================================================================

class XcbDisplayImpl : public XcbDisplay {
public:
    explicit XcbDisplayImpl(const DockOptions& options) : _options(options) {}

    ~XcbDisplayImpl() override {
        if (auto res = teardown(); !res) {
            ywarn("XcbDisplay: teardown failed: {}", error_msg(res));
        }
    }

    //=========================================================================
    // Initialization
    //=========================================================================

    Result<void> init(const std::string& displayName) {
        if (_options.height <= 0) {
            return Err<void>("bar height must be positive");
        }

        int screenNum = 0;
        _conn = xcb_connect(displayName.empty() ? nullptr : displayName.c_str(), &screenNum);
        if (int err = xcb_connection_has_error(_conn); err != 0) {
            xcb_disconnect(_conn);
            _conn = nullptr;
            return Err<void>("cannot connect to X server" +
                             (displayName.empty() ? std::string() : " '" + displayName + "'") +
                             " (error " + std::to_string(err) + ")");
        }

        xcb_screen_iterator_t it = xcb_setup_roots_iterator(xcb_get_setup(_conn));
        for (int i = 0; i < screenNum && it.rem; ++i) {
            xcb_screen_next(&it);
        }
        _screen = it.data;
        if (!_screen) {
            return Err<void>("X server has no screen " + std::to_string(screenNum));
        }

        if (auto res = computeGeometry(); !res) {
            return res;
        }
        if (auto res = internAtoms(); !res) {
            return res;
        }

        pickVisual();

        if (auto res = createWindow(); !res) {
            return res;
        }
        setDockProperties();

        xcb_map_window(_conn, _window);

        // Some window managers ignore the position given at creation
        const uint32_t position[] = {uint32_t(_x), uint32_t(_y)};
        xcb_configure_window(_conn, _window, XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y, position);

        xcb_flush(_conn);
        if (auto res = check(); !res) {
            return res;
        }

        yinfo("XcbDisplay: {}x{}+{}+{} depth {} ({})", _width, _options.height, _x, _y, _depth,
              _options.edge == Edge::Top ? "top" : "bottom");
        return Ok();
    }

    //=========================================================================
    // DisplayConnection interface
    //=========================================================================

    int fd() const override { return _conn ? xcb_get_file_descriptor(_conn) : -1; }
    int width() const override { return _width; }
    int height() const override { return _height; }
    int depth() const override { return _depth; }

    Result<void> check() override {
        if (!_conn) {
            return Err<void>("X connection closed");
        }
        if (int err = xcb_connection_has_error(_conn); err != 0) {
            return Err<void>("X connection error " + std::to_string(err));
        }
        return Ok();
    }

    Result<void> pollEvents(std::vector<DisplayEvent>& out) override {
        if (auto res = check(); !res) {
            return res;
        }

        while (xcb_generic_event_t* ev = xcb_poll_for_event(_conn)) {
            translate(ev, out);
            free(ev);
        }

        // xcb_poll_for_event returns nullptr on connection loss too
        return check();
    }

    Result<void> present(const PixelBuffer& buffer, const std::vector<Rect>& rects) override {
        if (auto res = check(); !res) {
            return res;
        }

        // Request length is counted in 4-byte units and includes the header
        const size_t maxBytes = size_t(xcb_get_maximum_request_length(_conn)) * 4 - sizeof(xcb_put_image_request_t);

        for (const Rect& rect : rects) {
            Rect r = rect.intersected(buffer.bounds()).intersected({0, 0, _width, _height});
            if (r.empty()) continue;

            const size_t rowBytes = size_t(r.w) * 4;
            const int rowsPerChunk = std::max<int>(1, int(maxBytes / rowBytes));

            for (int y = r.y; y < r.bottom(); y += rowsPerChunk) {
                int rows = std::min(rowsPerChunk, r.bottom() - y);
                _scratch.resize(size_t(r.w) * size_t(rows));
                for (int row = 0; row < rows; ++row) {
                    std::memcpy(_scratch.data() + size_t(row) * size_t(r.w),
                                buffer.row(y + row) + r.x, rowBytes);
                }
                xcb_put_image(_conn, XCB_IMAGE_FORMAT_Z_PIXMAP, _window, _gc,
                              uint16_t(r.w), uint16_t(rows), int16_t(r.x), int16_t(y), 0,
                              uint8_t(_depth), uint32_t(_scratch.size() * 4),
                              reinterpret_cast<const uint8_t*>(_scratch.data()));
            }
        }

        xcb_flush(_conn);
        return check();
    }

    Result<void> teardown() override {
        if (!_conn) {
            return Ok();
        }
        ydebug("XcbDisplay: teardown");
        if (_gc) xcb_free_gc(_conn, _gc);
        if (_window) xcb_destroy_window(_conn, _window);
        if (_colormap) xcb_free_colormap(_conn, _colormap);
        xcb_flush(_conn);
        xcb_disconnect(_conn);
        _conn = nullptr;
        _gc = 0;
        _window = 0;
        _colormap = 0;
        return Ok();
    }

private:
    //=========================================================================
    // Setup helpers
    //=========================================================================

    Result<void> computeGeometry() {
        const int screenW = _screen->width_in_pixels;
        const int screenH = _screen->height_in_pixels;

        if (_options.x < 0 || _options.x >= screenW) {
            return Err<void>("bar x offset " + std::to_string(_options.x) +
                             " is outside the screen (width " + std::to_string(screenW) + ")");
        }
        _x = _options.x;
        _width = _options.width > 0 ? std::min(_options.width, screenW - _x) : screenW - _x;
        _height = _options.height;
        if (_height + _options.margin > screenH) {
            return Err<void>("bar height " + std::to_string(_height) + " does not fit the screen");
        }
        _y = _options.edge == Edge::Top ? _options.margin : screenH - _height - _options.margin;
        return Ok();
    }

    Result<void> internAtoms() {
        xcb_intern_atom_cookie_t cookies[ATOM_COUNT];
        for (int i = 0; i < ATOM_COUNT; ++i) {
            cookies[i] = xcb_intern_atom(_conn, 0, uint16_t(strlen(kAtomNames[i])), kAtomNames[i]);
        }
        for (int i = 0; i < ATOM_COUNT; ++i) {
            xcb_intern_atom_reply_t* reply = xcb_intern_atom_reply(_conn, cookies[i], nullptr);
            if (!reply) {
                return Err<void>(std::string("failed to intern atom ") + kAtomNames[i]);
            }
            _atoms[i] = reply->atom;
            free(reply);
        }
        return Ok();
    }

    // Prefer a 32-bit TrueColor visual so the background alpha reaches the
    // compositor; fall back to the root visual
    void pickVisual() {
        _visual = _screen->root_visual;
        _depth = _screen->root_depth;

        xcb_depth_iterator_t depthIt = xcb_screen_allowed_depths_iterator(_screen);
        for (; depthIt.rem; xcb_depth_next(&depthIt)) {
            if (depthIt.data->depth != 32) continue;
            xcb_visualtype_iterator_t visIt = xcb_depth_visuals_iterator(depthIt.data);
            for (; visIt.rem; xcb_visualtype_next(&visIt)) {
                if (visIt.data->_class == XCB_VISUAL_CLASS_TRUE_COLOR) {
                    _visual = visIt.data->visual_id;
                    _depth = 32;
                    return;
                }
            }
        }
        ywarn("XcbDisplay: no 32-bit visual, using the root visual (no transparency)");
    }

    Result<void> createWindow() {
        _colormap = xcb_generate_id(_conn);
        xcb_create_colormap(_conn, XCB_COLORMAP_ALLOC_NONE, _colormap, _screen->root, _visual);

        _window = xcb_generate_id(_conn);
        const uint32_t mask = XCB_CW_BACK_PIXEL | XCB_CW_BORDER_PIXEL | XCB_CW_EVENT_MASK | XCB_CW_COLORMAP;
        const uint32_t values[] = {
            0,
            0,
            XCB_EVENT_MASK_EXPOSURE | XCB_EVENT_MASK_BUTTON_PRESS | XCB_EVENT_MASK_BUTTON_RELEASE |
                XCB_EVENT_MASK_STRUCTURE_NOTIFY,
            _colormap,
        };
        xcb_void_cookie_t cookie = xcb_create_window_checked(
            _conn, uint8_t(_depth), _window, _screen->root,
            int16_t(_x), int16_t(_y), uint16_t(_width), uint16_t(_height), 0,
            XCB_WINDOW_CLASS_INPUT_OUTPUT, _visual, mask, values);
        if (xcb_generic_error_t* err = xcb_request_check(_conn, cookie)) {
            int code = err->error_code;
            free(err);
            _window = 0;
            return Err<void>("CreateWindow failed (X error " + std::to_string(code) + ")");
        }

        _gc = xcb_generate_id(_conn);
        xcb_create_gc(_conn, _gc, _window, 0, nullptr);
        return Ok();
    }

    void setDockProperties() {
        auto setCardinals = [&](xcb_atom_t property, xcb_atom_t type, const uint32_t* data, uint32_t count) {
            xcb_change_property(_conn, XCB_PROP_MODE_REPLACE, _window, property, type, 32, count, data);
        };

        setCardinals(_atoms[NET_WM_WINDOW_TYPE], XCB_ATOM_ATOM, &_atoms[NET_WM_WINDOW_TYPE_DOCK], 1);

        const xcb_atom_t states[] = {_atoms[NET_WM_STATE_STICKY], _atoms[NET_WM_STATE_ABOVE]};
        setCardinals(_atoms[NET_WM_STATE], XCB_ATOM_ATOM, states, 2);

        const uint32_t allDesktops = 0xFFFFFFFF;
        setCardinals(_atoms[NET_WM_DESKTOP], XCB_ATOM_CARDINAL, &allDesktops, 1);

        // left, right, top, bottom, then start/end pairs for each edge
        uint32_t strut[12] = {0};
        const uint32_t reserved = uint32_t(_height + _options.margin);
        if (_options.edge == Edge::Top) {
            strut[2] = reserved;
            strut[8] = uint32_t(_x);
            strut[9] = uint32_t(_x + _width - 1);
        } else {
            strut[3] = reserved;
            strut[10] = uint32_t(_x);
            strut[11] = uint32_t(_x + _width - 1);
        }
        setCardinals(_atoms[NET_WM_STRUT_PARTIAL], XCB_ATOM_CARDINAL, strut, 12);
        setCardinals(_atoms[NET_WM_STRUT], XCB_ATOM_CARDINAL, strut, 4);

        uint32_t hints[kWmHintsLength] = {0};
        hints[0] = kWmHintsInputHint;
        hints[1] = 0;  // never takes keyboard focus
        setCardinals(XCB_ATOM_WM_HINTS, XCB_ATOM_WM_HINTS, hints, kWmHintsLength);

        const std::string& name = _options.name;
        xcb_change_property(_conn, XCB_PROP_MODE_REPLACE, _window, XCB_ATOM_WM_NAME, XCB_ATOM_STRING,
                            8, uint32_t(name.size()), name.data());
        xcb_change_property(_conn, XCB_PROP_MODE_REPLACE, _window, _atoms[NET_WM_NAME], _atoms[UTF8_STRING],
                            8, uint32_t(name.size()), name.data());

        // instance\0class\0
        std::string wmClass = name + '\0' + name + '\0';
        xcb_change_property(_conn, XCB_PROP_MODE_REPLACE, _window, XCB_ATOM_WM_CLASS, XCB_ATOM_STRING,
                            8, uint32_t(wmClass.size()), wmClass.data());
    }

    //=========================================================================
    // Events
    //=========================================================================

    void translate(xcb_generic_event_t* ev, std::vector<DisplayEvent>& out) {
        const uint8_t type = ev->response_type & ~0x80;
        switch (type) {
            case 0: {
                auto* err = reinterpret_cast<xcb_generic_error_t*>(ev);
                ywarn("XcbDisplay: X error {} (request {}.{}, sequence {})",
                      err->error_code, err->major_code, err->minor_code, err->sequence);
                break;
            }

            case XCB_EXPOSE: {
                auto* e = reinterpret_cast<xcb_expose_event_t*>(ev);
                out.push_back(Exposed{{e->x, e->y, e->width, e->height}});
                break;
            }

            case XCB_BUTTON_PRESS:
            case XCB_BUTTON_RELEASE: {
                auto* e = reinterpret_cast<xcb_button_press_event_t*>(ev);
                auto button = buttonFromX11(e->detail);
                if (!button) {
                    ydebug("XcbDisplay: ignoring pointer button {}", e->detail);
                    break;
                }
                out.push_back(PointerButton{e->event_x, e->event_y, *button, type == XCB_BUTTON_PRESS});
                break;
            }

            case XCB_CONFIGURE_NOTIFY: {
                auto* e = reinterpret_cast<xcb_configure_notify_event_t*>(ev);
                if (e->window != _window) break;
                if (e->width != _width || e->height != _height) {
                    _width = e->width;
                    _height = e->height;
                    out.push_back(Configured{_width, _height});
                }
                break;
            }

            default:
                break;
        }
    }

    DockOptions _options;
    xcb_connection_t* _conn = nullptr;
    xcb_screen_t* _screen = nullptr;
    xcb_atom_t _atoms[ATOM_COUNT] = {};
    xcb_visualid_t _visual = 0;
    int _depth = 24;
    xcb_colormap_t _colormap = 0;
    xcb_window_t _window = 0;
    xcb_gcontext_t _gc = 0;

    int _x = 0;
    int _y = 0;
    int _width = 0;
    int _height = 0;

    std::vector<uint32_t> _scratch;
};

//=============================================================================
// Factory
//=============================================================================

Result<XcbDisplay::Ptr> XcbDisplay::create(const DockOptions& options, const std::string& displayName) noexcept {
    auto display = std::make_shared<XcbDisplayImpl>(options);
    if (auto res = display->init(displayName); !res) {
        return Err<Ptr>("Failed to initialize XcbDisplay", res);
    }
    return Ok(Ptr(display));
}

} // namespace lazybar
