#pragma once

#include <lazybar/font/font-face.h>
#include <lazybar/result.hpp>
#include <string>
#include <vector>

namespace lazybar {

/**
 * FreeTypeFace - FontFace backed by a TTF/OTF file
 *
 * Glyphs are rasterized on first use into 8-bit coverage masks and cached
 * per codepoint. A missing codepoint falls back to U+FFFD, then to '?'.
 */
class FreeTypeFace : public FontFace {
public:
    using Ptr = std::shared_ptr<FreeTypeFace>;

    static Result<Ptr> create(const std::string& path, uint32_t pixelSize) noexcept;

    // Well-known locations tried when no font path is configured
    static const std::vector<std::string>& defaultFontPaths();

    ~FreeTypeFace() override = default;

    virtual const std::string& path() const = 0;
    virtual uint32_t pixelSize() const = 0;

protected:
    FreeTypeFace() = default;
};

} // namespace lazybar
