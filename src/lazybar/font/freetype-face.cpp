#include <lazybar/font/freetype-face.h>
#include <ytrace/ytrace.hpp>
#include <ft2build.h>
#include FT_FREETYPE_H
#include <cmath>
#include <cstring>
#include <mutex>
#include <unordered_map>

namespace lazybar {

//=============================================================================
// FreeTypeFaceImpl
//=============================================================================

class FreeTypeFaceImpl : public FreeTypeFace {
public:
    FreeTypeFaceImpl(const std::string& path, uint32_t pixelSize)
        : _path(path), _pixelSize(pixelSize) {}

    ~FreeTypeFaceImpl() override {
        if (_face) FT_Done_Face(_face);
        if (_library) FT_Done_FreeType(_library);
    }

    //=========================================================================
    // Initialization
    //=========================================================================

    Result<void> init() {
        if (_pixelSize == 0) {
            return Err<void>("Font pixel size must be positive");
        }
        if (FT_Init_FreeType(&_library)) {
            _library = nullptr;
            return Err<void>("Failed to initialize FreeType");
        }
        if (FT_New_Face(_library, _path.c_str(), 0, &_face)) {
            _face = nullptr;
            return Err<void>("Failed to load font: " + _path);
        }
        if (FT_Set_Pixel_Sizes(_face, 0, _pixelSize)) {
            return Err<void>("Font does not support size " + std::to_string(_pixelSize));
        }

        // FreeType metrics are in 26.6 fixed point
        _metrics.ascender = static_cast<int>(_face->size->metrics.ascender >> 6);
        _metrics.descender = std::abs(static_cast<int>(_face->size->metrics.descender >> 6));

        yinfo("FreeTypeFace loaded: {} (size={}, ascender={}, descender={})",
              _path, _pixelSize, _metrics.ascender, _metrics.descender);
        return Ok();
    }

    //=========================================================================
    // FontFace interface
    //=========================================================================

    FontMetrics metrics() const override { return _metrics; }

    int advance(uint32_t codepoint) override {
        const GlyphBitmap* g = glyph(codepoint);
        return g ? g->advance : 0;
    }

    const GlyphBitmap* glyph(uint32_t codepoint) override {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _cache.find(codepoint);
        if (it != _cache.end()) {
            return it->second.get();
        }

        auto bitmap = rasterize(codepoint);
        if (!bitmap) {
            for (uint32_t fallback : {0xFFFDu, uint32_t('?')}) {
                if (fallback == codepoint) continue;
                bitmap = rasterize(fallback);
                if (bitmap) break;
            }
        }
        if (!bitmap) {
            ywarn("FreeTypeFace: no glyph for U+{:04X} and no replacement", codepoint);
        }
        auto* raw = bitmap.get();
        _cache.emplace(codepoint, std::move(bitmap));
        return raw;
    }

    const std::string& path() const override { return _path; }
    uint32_t pixelSize() const override { return _pixelSize; }

private:
    // Called with _mutex held
    std::unique_ptr<GlyphBitmap> rasterize(uint32_t codepoint) {
        FT_UInt glyphIndex = FT_Get_Char_Index(_face, codepoint);
        if (glyphIndex == 0) {
            return nullptr;
        }
        if (FT_Load_Glyph(_face, glyphIndex, FT_LOAD_RENDER | FT_LOAD_TARGET_NORMAL)) {
            return nullptr;
        }

        FT_GlyphSlot slot = _face->glyph;
        const FT_Bitmap& bitmap = slot->bitmap;

        auto out = std::make_unique<GlyphBitmap>();
        out->width = static_cast<int>(bitmap.width);
        out->rows = static_cast<int>(bitmap.rows);
        out->left = slot->bitmap_left;
        out->top = slot->bitmap_top;
        out->advance = static_cast<int>(slot->advance.x >> 6);
        out->coverage.resize(size_t(out->width) * size_t(out->rows));

        // Copy row by row: pitch may be padded or negative
        for (int y = 0; y < out->rows; ++y) {
            const uint8_t* src = bitmap.buffer + y * bitmap.pitch;
            std::memcpy(out->coverage.data() + size_t(y) * size_t(out->width), src, size_t(out->width));
        }
        return out;
    }

    std::string _path;
    uint32_t _pixelSize;
    FT_Library _library = nullptr;
    FT_Face _face = nullptr;
    FontMetrics _metrics;

    std::mutex _mutex;
    std::unordered_map<uint32_t, std::unique_ptr<GlyphBitmap>> _cache;
};

//=============================================================================
// Factory
//=============================================================================

Result<FreeTypeFace::Ptr> FreeTypeFace::create(const std::string& path, uint32_t pixelSize) noexcept {
    auto face = std::make_shared<FreeTypeFaceImpl>(path, pixelSize);
    if (auto res = face->init(); !res) {
        return Err<Ptr>("Failed to initialize FreeTypeFace", res);
    }
    return Ok(Ptr(face));
}

const std::vector<std::string>& FreeTypeFace::defaultFontPaths() {
    static const std::vector<std::string> paths = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
        "/usr/share/fonts/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf",
        "/usr/share/fonts/noto/NotoSansMono-Regular.ttf",
    };
    return paths;
}

} // namespace lazybar
