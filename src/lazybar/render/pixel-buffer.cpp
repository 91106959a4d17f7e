#include <lazybar/render/pixel-buffer.h>
#include <algorithm>

namespace lazybar {

namespace {

inline uint32_t mul8(uint32_t a, uint32_t b) {
    // Exact a*b/255 rounded
    uint32_t t = a * b + 128;
    return (t + (t >> 8)) >> 8;
}

// src-over on premultiplied pixels
inline uint32_t over(uint32_t src, uint32_t dst) {
    uint32_t inv = 255 - (src >> 24);
    if (inv == 0) return src;
    uint32_t a = (src >> 24) + mul8(dst >> 24, inv);
    uint32_t r = ((src >> 16) & 0xFF) + mul8((dst >> 16) & 0xFF, inv);
    uint32_t g = ((src >> 8) & 0xFF) + mul8((dst >> 8) & 0xFF, inv);
    uint32_t b = (src & 0xFF) + mul8(dst & 0xFF, inv);
    return (a << 24) | (r << 16) | (g << 8) | b;
}

inline uint32_t scale(uint32_t px, uint32_t coverage) {
    uint32_t a = mul8(px >> 24, coverage);
    uint32_t r = mul8((px >> 16) & 0xFF, coverage);
    uint32_t g = mul8((px >> 8) & 0xFF, coverage);
    uint32_t b = mul8(px & 0xFF, coverage);
    return (a << 24) | (r << 16) | (g << 8) | b;
}

} // namespace

uint32_t PixelBuffer::premultiply(Color color) {
    uint32_t a = color.a();
    return (a << 24) | (mul8(color.r(), a) << 16) | (mul8(color.g(), a) << 8) | mul8(color.b(), a);
}

void PixelBuffer::resize(int width, int height) {
    _width = std::max(width, 0);
    _height = std::max(height, 0);
    _pixels.assign(size_t(_width) * size_t(_height), 0);
}

void PixelBuffer::fill(const Rect& rect, Color color) {
    Rect r = rect.intersected(bounds());
    if (r.empty()) return;
    const uint32_t px = premultiply(color);
    for (int y = r.y; y < r.bottom(); ++y) {
        uint32_t* dst = row(y) + r.x;
        std::fill(dst, dst + r.w, px);
    }
}

void PixelBuffer::blend(const Rect& rect, Color color) {
    if (color.a() == 0xFF) {
        fill(rect, color);
        return;
    }
    if (color.a() == 0) return;

    Rect r = rect.intersected(bounds());
    if (r.empty()) return;
    const uint32_t px = premultiply(color);
    for (int y = r.y; y < r.bottom(); ++y) {
        uint32_t* dst = row(y) + r.x;
        for (int x = 0; x < r.w; ++x) {
            dst[x] = over(px, dst[x]);
        }
    }
}

void PixelBuffer::blendPixel(int x, int y, Color color, uint8_t coverage) {
    if (coverage == 0 || x < 0 || y < 0 || x >= _width || y >= _height) return;
    uint32_t src = scale(premultiply(color), coverage);
    uint32_t& dst = row(y)[x];
    dst = over(src, dst);
}

} // namespace lazybar
