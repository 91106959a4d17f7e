#pragma once

#include <lazybar/font/font-face.h>
#include <lazybar/render-frame.h>
#include <lazybar/render/pixel-buffer.h>

namespace lazybar {

//-----------------------------------------------------------------------------
// Painter - rasterizes a RenderFrame into a PixelBuffer, one dirty rectangle
// at a time. Pixels outside the dirty rectangle are never written, and the
// result inside it depends only on the frame.
//-----------------------------------------------------------------------------
class Painter {
public:
    explicit Painter(FontFace::Ptr face) : _face(std::move(face)) {}

    void paint(PixelBuffer& buffer, const RenderFrame& frame, const Rect& dirty) const;

private:
    void drawRun(PixelBuffer& buffer, const Run& run, const Rect& clip) const;
    void drawGlyphs(PixelBuffer& buffer, const Run& run, const Rect& clip) const;

    FontFace::Ptr _face;
};

} // namespace lazybar
