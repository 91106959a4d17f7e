#pragma once

#include <lazybar/geometry.h>
#include <cstdint>
#include <vector>

namespace lazybar {

//-----------------------------------------------------------------------------
// PixelBuffer - off-screen 32-bit ARGB image, premultiplied alpha, matching
// what a 32-bit TrueColor X visual expects. Rows are tightly packed.
//-----------------------------------------------------------------------------
class PixelBuffer {
public:
    PixelBuffer() = default;
    PixelBuffer(int width, int height) { resize(width, height); }

    // Contents are cleared to transparent
    void resize(int width, int height);

    int width() const { return _width; }
    int height() const { return _height; }
    Rect bounds() const { return {0, 0, _width, _height}; }

    uint32_t* data() { return _pixels.data(); }
    const uint32_t* data() const { return _pixels.data(); }
    uint32_t* row(int y) { return _pixels.data() + size_t(y) * size_t(_width); }
    const uint32_t* row(int y) const { return _pixels.data() + size_t(y) * size_t(_width); }

    uint32_t pixel(int x, int y) const { return row(y)[x]; }

    // Overwrite every pixel of `rect` (clipped to the buffer)
    void fill(const Rect& rect, Color color);

    // Composite `color` over `rect` (clipped to the buffer)
    void blend(const Rect& rect, Color color);

    // Composite one pixel scaled by an 8-bit coverage value
    void blendPixel(int x, int y, Color color, uint8_t coverage);

    static uint32_t premultiply(Color color);

private:
    int _width = 0;
    int _height = 0;
    std::vector<uint32_t> _pixels;
};

} // namespace lazybar
