#pragma once

#include <cstdint>
#include <memory>
#include <vector>

namespace lazybar {

struct FontMetrics {
    int ascender = 0;   // pixels above the baseline
    int descender = 0;  // pixels below the baseline (positive)

    int lineHeight() const { return ascender + descender; }
};

//-----------------------------------------------------------------------------
// GlyphBitmap - 8-bit coverage mask positioned relative to the pen
//-----------------------------------------------------------------------------
struct GlyphBitmap {
    int width = 0;
    int rows = 0;
    int left = 0;     // pen x -> first column
    int top = 0;      // baseline -> first row (positive = up)
    int advance = 0;  // pen advance in pixels
    std::vector<uint8_t> coverage;  // width * rows, row-major
};

//-----------------------------------------------------------------------------
// FontFace - the glyph provider used by layout and painting
//
// Layout runs on adapter worker threads and painting on the bar thread, so
// implementations must be safe to call concurrently. Returned bitmaps stay
// valid for the lifetime of the face.
//-----------------------------------------------------------------------------
class FontFace {
public:
    using Ptr = std::shared_ptr<FontFace>;

    virtual ~FontFace() = default;

    virtual FontMetrics metrics() const = 0;

    // Horizontal advance in pixels; missing glyphs advance like the
    // replacement glyph
    virtual int advance(uint32_t codepoint) = 0;

    // nullptr when the face has neither the glyph nor a replacement
    virtual const GlyphBitmap* glyph(uint32_t codepoint) = 0;
};

} // namespace lazybar
