#include <lazybar/render/painter.h>
#include <algorithm>
#include <cmath>

namespace lazybar {

void Painter::paint(PixelBuffer& buffer, const RenderFrame& frame, const Rect& dirty) const {
    Rect area = dirty.intersected(buffer.bounds());
    if (area.empty()) return;

    buffer.fill(area, frame.background);

    for (const auto& placed : frame.runs) {
        Rect clip = area.intersected(placed.clip).intersected(placed.run.box);
        if (clip.empty()) continue;
        drawRun(buffer, placed.run, clip);
    }
}

void Painter::drawRun(PixelBuffer& buffer, const Run& run, const Rect& clip) const {
    buffer.blend(clip, run.bg);

    switch (run.kind) {
        case Run::Kind::Box:
            break;

        case Run::Kind::Glyphs:
            drawGlyphs(buffer, run, clip);
            break;

        case Run::Kind::Meter: {
            // Bar occupies the middle third of the track
            const Rect& box = run.box;
            int filled = static_cast<int>(std::lround(double(box.w) * double(run.fraction)));
            int inset = box.h / 3;
            Rect bar{box.x, box.y + inset, filled, box.h - 2 * inset};
            buffer.blend(bar.intersected(clip), run.fg);
            break;
        }
    }
}

void Painter::drawGlyphs(PixelBuffer& buffer, const Run& run, const Rect& clip) const {
    if (!_face) return;

    const int baselineY = run.box.y + run.baseline;

    for (const auto& g : run.glyphs) {
        const GlyphBitmap* bitmap = _face->glyph(g.codepoint);
        if (!bitmap || bitmap->width == 0 || bitmap->rows == 0) continue;

        const int left = g.x + bitmap->left;
        const int top = baselineY - bitmap->top;
        Rect glyphRect{left, top, bitmap->width, bitmap->rows};
        Rect visible = glyphRect.intersected(clip);
        if (visible.empty()) continue;

        for (int y = visible.y; y < visible.bottom(); ++y) {
            const uint8_t* src = bitmap->coverage.data() + size_t(y - top) * size_t(bitmap->width);
            for (int x = visible.x; x < visible.right(); ++x) {
                buffer.blendPixel(x, y, run.fg, src[x - left]);
            }
        }
    }
}

} // namespace lazybar
