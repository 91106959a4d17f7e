#pragma once

//=============================================================================
// LayoutEngine
//
// Turns a widget's ContentItem into immutable runs positioned in widget-local
// coordinates, with the measured width and height of the whole widget.
//=============================================================================

#include <lazybar/content.h>
#include <lazybar/font/font-face.h>
#include <lazybar/geometry.h>
#include <lazybar/result.hpp>
#include <memory>
#include <string_view>
#include <vector>

namespace lazybar {

struct GlyphPosition {
    uint32_t codepoint = 0;
    int x = 0;  // pen position, widget-local

    bool operator==(const GlyphPosition&) const = default;
};

//-----------------------------------------------------------------------------
// Run - atomic piece of content. `box` is widget-local and always spans the
// full bar height so that a run's background fully covers its column.
//-----------------------------------------------------------------------------
struct Run {
    enum class Kind : uint8_t {
        Glyphs,  // glyphs drawn in fg over a bg-filled box
        Box,     // bg-filled box only (padding, gaps)
        Meter,   // bg-filled track with an fg bar filled to `fraction`
    };

    Kind kind = Kind::Box;
    Rect box;
    Color fg;
    Color bg;
    int baseline = 0;
    float fraction = 0.0f;
    std::vector<GlyphPosition> glyphs;

    bool operator==(const Run&) const = default;
};

struct LayoutResult {
    std::vector<Run> runs;
    int width = 0;
    int height = 0;

    bool operator==(const LayoutResult&) const = default;
};

class LayoutEngine {
public:
    using Ptr = std::shared_ptr<LayoutEngine>;

    struct Options {
        int height = 24;      // bar height
        int padding = 4;      // horizontal padding on both sides of non-empty content
        Color foreground = Color(0xFFFFFFFF);
        Color background = Color(0x00000000);
    };

    static Result<Ptr> create(FontFace::Ptr face, const Options& options) noexcept;

    // Thread-safe: called by every adapter's worker thread
    LayoutResult layout(const ContentItem& item, const Attrs& attrs = {}) const;

    const Options& options() const { return _options; }
    const FontFace::Ptr& face() const { return _face; }

    static std::vector<uint32_t> decodeUtf8(std::string_view text);

private:
    LayoutEngine(FontFace::Ptr face, const Options& options) noexcept;
    Result<void> init() noexcept;

    FontFace::Ptr _face;
    Options _options;
    int _baseline = 0;
};

} // namespace lazybar
