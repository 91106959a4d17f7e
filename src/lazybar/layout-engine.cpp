#include <lazybar/layout-engine.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace lazybar {

LayoutEngine::LayoutEngine(FontFace::Ptr face, const Options& options) noexcept
    : _face(std::move(face)), _options(options) {}

Result<LayoutEngine::Ptr> LayoutEngine::create(FontFace::Ptr face, const Options& options) noexcept {
    auto engine = Ptr(new LayoutEngine(std::move(face), options));
    if (auto res = engine->init(); !res) {
        return Err<Ptr>("Failed to initialize LayoutEngine", res);
    }
    return Ok(engine);
}

Result<void> LayoutEngine::init() noexcept {
    if (!_face) {
        return Err<void>("LayoutEngine: null font face");
    }
    if (_options.height <= 0) {
        return Err<void>("LayoutEngine: height must be positive, got " + std::to_string(_options.height));
    }
    if (_options.padding < 0) {
        ywarn("LayoutEngine: negative padding {} clamped to 0", _options.padding);
        _options.padding = 0;
    }

    // Center the line box vertically inside the bar
    FontMetrics m = _face->metrics();
    _baseline = (_options.height - m.lineHeight()) / 2 + m.ascender;
    ydebug("LayoutEngine: height={} lineHeight={} baseline={}",
           _options.height, m.lineHeight(), _baseline);
    return Ok();
}

//-----------------------------------------------------------------------------
// UTF-8
//-----------------------------------------------------------------------------

std::vector<uint32_t> LayoutEngine::decodeUtf8(std::string_view text) {
    std::vector<uint32_t> out;
    out.reserve(text.size());

    auto ptr = reinterpret_cast<const uint8_t*>(text.data());
    const uint8_t* end = ptr + text.size();

    while (ptr < end) {
        uint32_t codepoint = 0;
        int extra = 0;
        if ((*ptr & 0x80) == 0) {
            codepoint = *ptr++;
        } else if ((*ptr & 0xE0) == 0xC0) {
            codepoint = *ptr++ & 0x1F;
            extra = 1;
        } else if ((*ptr & 0xF0) == 0xE0) {
            codepoint = *ptr++ & 0x0F;
            extra = 2;
        } else if ((*ptr & 0xF8) == 0xF0) {
            codepoint = *ptr++ & 0x07;
            extra = 3;
        } else {
            ptr++;  // Invalid lead byte
            out.push_back(0xFFFD);
            continue;
        }

        bool truncated = false;
        for (int i = 0; i < extra; ++i) {
            if (ptr >= end || (*ptr & 0xC0) != 0x80) {
                truncated = true;
                break;
            }
            codepoint = (codepoint << 6) | (*ptr++ & 0x3F);
        }
        static constexpr uint32_t minForLength[] = {0, 0x80, 0x800, 0x10000};
        bool invalid = truncated || codepoint < minForLength[extra] || codepoint > 0x10FFFF ||
                       (codepoint >= 0xD800 && codepoint <= 0xDFFF);
        out.push_back(invalid ? 0xFFFD : codepoint);
    }
    return out;
}

//-----------------------------------------------------------------------------
// Layout
//-----------------------------------------------------------------------------

LayoutResult LayoutEngine::layout(const ContentItem& item, const Attrs& attrs) const {
    LayoutResult result;
    result.height = _options.height;

    const Color defaultFg = attrs.fg.value_or(_options.foreground);
    const Color defaultBg = attrs.bg.value_or(_options.background);

    int pen = _options.padding;

    auto boxAt = [&](int width) {
        return Rect{pen, 0, width, _options.height};
    };

    for (const auto& seg : item.segments) {
        Run run;
        run.fg = seg.fg.value_or(defaultFg);
        run.bg = seg.bg.value_or(defaultBg);
        run.baseline = _baseline;

        switch (seg.kind) {
            case Segment::Kind::Text:
            case Segment::Kind::Icon: {
                std::vector<uint32_t> codepoints;
                if (seg.kind == Segment::Kind::Icon) {
                    codepoints.push_back(seg.icon);
                } else {
                    codepoints = decodeUtf8(seg.text);
                }

                int x = pen;
                for (uint32_t cp : codepoints) {
                    if (cp < 0x20 || cp == 0x7F) continue;  // controls have no place on one line
                    run.glyphs.push_back({cp, x});
                    x += _face->advance(cp);
                }
                if (run.glyphs.empty()) continue;

                run.kind = Run::Kind::Glyphs;
                run.box = boxAt(x - pen);
                break;
            }

            case Segment::Kind::Meter: {
                int width = seg.width;
                if (width < 0) {
                    ywarn("LayoutEngine: meter width {} clamped to 0", width);
                    width = 0;
                }
                if (width == 0) continue;
                run.kind = Run::Kind::Meter;
                run.fraction = std::clamp(seg.fraction, 0.0f, 1.0f);
                run.box = boxAt(width);
                break;
            }

            case Segment::Kind::Gap: {
                int width = seg.width;
                if (width < 0) {
                    ywarn("LayoutEngine: gap width {} clamped to 0", width);
                    width = 0;
                }
                if (width == 0) continue;
                run.kind = Run::Kind::Box;
                run.box = boxAt(width);
                break;
            }
        }

        pen = run.box.right();
        result.runs.push_back(std::move(run));
    }

    // Nothing visible: the widget collapses to zero width
    if (result.runs.empty()) {
        return result;
    }

    if (_options.padding > 0) {
        Run lead;
        lead.kind = Run::Kind::Box;
        lead.box = {0, 0, _options.padding, _options.height};
        lead.fg = defaultFg;
        lead.bg = defaultBg;
        lead.baseline = _baseline;

        Run trail = lead;
        trail.box.x = pen;

        result.runs.insert(result.runs.begin(), std::move(lead));
        result.runs.push_back(std::move(trail));
        pen += _options.padding;
    }

    result.width = pen;
    return result;
}

} // namespace lazybar
