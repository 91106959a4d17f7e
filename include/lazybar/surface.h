#pragma once

//=============================================================================
// Surface
//
// Off-screen ARGB buffer mirroring the docked window. Paints dirty rectangles
// of the current frame into the buffer and presents only those rectangles.
//=============================================================================

#include <lazybar/display.h>
#include <lazybar/event-bus.h>
#include <lazybar/font/font-face.h>
#include <lazybar/render-frame.h>
#include <lazybar/render/painter.h>
#include <lazybar/render/pixel-buffer.h>
#include <lazybar/result.hpp>
#include <memory>

namespace lazybar {

class Surface : public DisplayEventSource {
public:
    using Ptr = std::shared_ptr<Surface>;

    struct Stats {
        uint64_t paints = 0;
        uint64_t fullPaints = 0;
        uint64_t exposures = 0;
        uint64_t pixelsPainted = 0;
    };

    static Result<Ptr> create(DisplayConnection::Ptr display, FontFace::Ptr face) noexcept;

    ~Surface() override;

    // Paint `request` of `frame` and present it
    Result<void> paint(const RenderFrame::Ptr& frame, const RepaintRequest& request);

    // Repaint an exposed rectangle from the last painted frame
    Result<void> expose(const Rect& rect);

    // Match the buffer to a new window size; the next paint must be full
    Result<void> resize(int width, int height);

    Result<void> check() { return _display->check(); }

    // Destroy the window and disconnect
    Result<void> teardown();

    // DisplayEventSource
    int eventFd() const override { return _display->fd(); }
    Result<void> readEvents(std::vector<DisplayEvent>& out) override;

    const PixelBuffer& buffer() const { return _buffer; }
    const RenderFrame::Ptr& lastFrame() const { return _frame; }
    const Stats& stats() const { return _stats; }
    int width() const { return _buffer.width(); }
    int height() const { return _buffer.height(); }

private:
    Surface(DisplayConnection::Ptr display, FontFace::Ptr face) noexcept;
    Result<void> init() noexcept;

    Result<void> paintRect(const Rect& rect);

    DisplayConnection::Ptr _display;
    Painter _painter;
    PixelBuffer _buffer;
    RenderFrame::Ptr _frame;
    bool _tornDown = false;
    Stats _stats;
};

} // namespace lazybar
