#include <lazybar/surface.h>
#include <ytrace/ytrace.hpp>

namespace lazybar {

Surface::Surface(DisplayConnection::Ptr display, FontFace::Ptr face) noexcept
    : _display(std::move(display)), _painter(std::move(face)) {}

Surface::~Surface() {
    if (!_tornDown) {
        if (auto res = teardown(); !res) {
            ywarn("Surface: teardown at destruction failed: {}", error_msg(res));
        }
    }
}

Result<Surface::Ptr> Surface::create(DisplayConnection::Ptr display, FontFace::Ptr face) noexcept {
    if (!display) {
        return Err<Ptr>("Surface: null display connection");
    }
    auto surface = Ptr(new Surface(std::move(display), std::move(face)));
    if (auto res = surface->init(); !res) {
        return Err<Ptr>("Failed to initialize Surface", res);
    }
    return Ok(surface);
}

Result<void> Surface::init() noexcept {
    if (_display->width() <= 0 || _display->height() <= 0) {
        return Err<void>("Surface: display window has no area");
    }
    _buffer.resize(_display->width(), _display->height());
    ydebug("Surface: {}x{} buffer", _buffer.width(), _buffer.height());
    return Ok();
}

Result<void> Surface::paint(const RenderFrame::Ptr& frame, const RepaintRequest& request) {
    if (!frame) {
        return Err<void>("Surface::paint: null frame");
    }
    _frame = frame;
    if (request.empty()) {
        return Ok();
    }

    _stats.paints++;
    if (request.full) {
        _stats.fullPaints++;
        return paintRect(_buffer.bounds());
    }
    return paintRect(request.damage);
}

Result<void> Surface::expose(const Rect& rect) {
    _stats.exposures++;
    return paintRect(rect);
}

Result<void> Surface::resize(int width, int height) {
    if (width <= 0 || height <= 0) {
        return Err<void>("Surface::resize: invalid size " + std::to_string(width) + "x" + std::to_string(height));
    }
    if (width == _buffer.width() && height == _buffer.height()) {
        return Ok();
    }
    ydebug("Surface: resize {}x{} -> {}x{}", _buffer.width(), _buffer.height(), width, height);
    _buffer.resize(width, height);
    return Ok();
}

Result<void> Surface::paintRect(const Rect& rect) {
    Rect area = rect.intersected(_buffer.bounds());
    if (area.empty()) {
        return Ok();
    }
    if (_frame) {
        _painter.paint(_buffer, *_frame, area);
    }
    _stats.pixelsPainted += uint64_t(area.area());

    if (auto res = _display->present(_buffer, {area}); !res) {
        return Err<void>("Surface: present failed", res);
    }
    return Ok();
}

Result<void> Surface::readEvents(std::vector<DisplayEvent>& out) {
    return _display->pollEvents(out);
}

Result<void> Surface::teardown() {
    if (_tornDown) {
        return Ok();
    }
    _tornDown = true;
    return _display->teardown();
}

} // namespace lazybar
