#pragma once

#include <labelkit/base/object.h>
#include <labelkit/font.h>
#include <labelkit/result.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace labelkit {

class Canvas;

//=============================================================================
// TextCoverage - 8-bit alpha mask of a rasterized glyph run
//
// The box is placed relative to the pen origin on the baseline: its top-left
// corner sits at (penX + left, baselineY + top).
//=============================================================================
struct TextCoverage {
    int width = 0;
    int height = 0;
    int left = 0;
    int top = 0;
    std::vector<uint8_t> alpha;  // width * height, row-major

    bool empty() const { return width <= 0 || height <= 0; }
};

//=============================================================================
// RenderBackend - text measurement, glyph rasterization and canvas factory
//
// Builders measure through it during layout; labels draw through the canvases
// it creates. Resources needed for a call are acquired and released within
// that call.
//=============================================================================
class RenderBackend : public base::Object {
public:
    using Ptr = std::shared_ptr<RenderBackend>;

    const char* typeName() const override { return "RenderBackend"; }

    // Advance width of the run at the given size (size > 0)
    virtual Result<float> measureTextWidth(const std::string& text,
                                           const Font::Ptr& font,
                                           float size) = 0;

    // Distance from the top of the em box to the baseline at the given size
    virtual Result<float> fontAscent(const Font::Ptr& font, float size) = 0;

    virtual Result<TextCoverage> rasterizeText(const std::string& text,
                                               const Font::Ptr& font,
                                               float size) = 0;

    // Font used when an element carries none; may be null
    virtual Font::Ptr defaultFont() const = 0;

    // Canvas over a fresh pixmap of the given size (both > 0)
    Result<std::shared_ptr<Canvas>> newCanvas(int width, int height);

protected:
    RenderBackend() = default;
};

} // namespace labelkit
