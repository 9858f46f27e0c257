#include <labelkit/freetype-backend.h>
#include "freetype.h"
#include "../utf8.h"
#include <ytrace/ytrace.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <algorithm>
#include <climits>
#include <cmath>

namespace labelkit {

namespace {

// Owns an FT_Face for the duration of one backend call
class ScopedFace {
public:
    ScopedFace() = default;
    ~ScopedFace() {
        if (_face) FT_Done_Face(_face);
    }
    ScopedFace(const ScopedFace&) = delete;
    ScopedFace& operator=(const ScopedFace&) = delete;

    FT_Face* out() { return &_face; }
    FT_Face get() const { return _face; }

private:
    FT_Face _face = nullptr;
};

struct PlacedGlyph {
    int x;       // bitmap left edge relative to pen origin
    int y;       // bitmap top edge relative to baseline (negative = above)
    int width;
    int rows;
    std::vector<uint8_t> alpha;
};

} // namespace

//=============================================================================
// FreeTypeBackendImpl
//=============================================================================

class FreeTypeBackendImpl : public FreeTypeBackend {
public:
    explicit FreeTypeBackendImpl(Font::Ptr defaultFont)
        : _defaultFont(std::move(defaultFont)) {}

    Font::Ptr defaultFont() const override { return _defaultFont; }

    Result<float> measureTextWidth(const std::string& text, const Font::Ptr& font,
                                   float size) override {
        if (text.empty()) return Ok(0.0f);

        ScopedFace face;
        if (auto res = openFace(font, size, face); !res) {
            return Err<float>("FreeTypeBackend::measureTextWidth", res);
        }

        FT_Pos pen = 0;
        FT_UInt previous = 0;
        bool kerning = FT_HAS_KERNING(face.get());
        const uint8_t* ptr = reinterpret_cast<const uint8_t*>(text.data());
        const uint8_t* end = ptr + text.size();
        while (ptr < end) {
            uint32_t cp = decodeUtf8(ptr, end);
            FT_UInt glyphIndex = FT_Get_Char_Index(face.get(), cp);
            if (kerning && previous && glyphIndex) {
                FT_Vector delta;
                FT_Get_Kerning(face.get(), previous, glyphIndex, FT_KERNING_DEFAULT, &delta);
                pen += delta.x;
            }
            if (FT_Load_Glyph(face.get(), glyphIndex, FT_LOAD_DEFAULT)) {
                ywarn("FreeTypeBackend: failed to load glyph U+{:04X}", cp);
                continue;
            }
            pen += face.get()->glyph->advance.x;
            previous = glyphIndex;
        }
        return Ok(static_cast<float>(pen) / 64.0f);
    }

    Result<float> fontAscent(const Font::Ptr& font, float size) override {
        ScopedFace face;
        if (auto res = openFace(font, size, face); !res) {
            return Err<float>("FreeTypeBackend::fontAscent", res);
        }
        return Ok(static_cast<float>(face.get()->size->metrics.ascender) / 64.0f);
    }

    Result<TextCoverage> rasterizeText(const std::string& text, const Font::Ptr& font,
                                       float size) override {
        TextCoverage coverage;
        if (text.empty()) return Ok(std::move(coverage));

        ScopedFace face;
        if (auto res = openFace(font, size, face); !res) {
            return Err<TextCoverage>("FreeTypeBackend::rasterizeText", res);
        }

        std::vector<PlacedGlyph> glyphs;
        int minX = INT_MAX, minY = INT_MAX, maxX = INT_MIN, maxY = INT_MIN;
        FT_Pos pen = 0;
        FT_UInt previous = 0;
        bool kerning = FT_HAS_KERNING(face.get());

        const uint8_t* ptr = reinterpret_cast<const uint8_t*>(text.data());
        const uint8_t* end = ptr + text.size();
        while (ptr < end) {
            uint32_t cp = decodeUtf8(ptr, end);
            FT_UInt glyphIndex = FT_Get_Char_Index(face.get(), cp);
            if (kerning && previous && glyphIndex) {
                FT_Vector delta;
                FT_Get_Kerning(face.get(), previous, glyphIndex, FT_KERNING_DEFAULT, &delta);
                pen += delta.x;
            }
            if (FT_Load_Glyph(face.get(), glyphIndex, FT_LOAD_RENDER)) {
                ywarn("FreeTypeBackend: failed to render glyph U+{:04X}", cp);
                continue;
            }
            FT_GlyphSlot slot = face.get()->glyph;
            const FT_Bitmap& bitmap = slot->bitmap;

            if (bitmap.width > 0 && bitmap.rows > 0 &&
                bitmap.pixel_mode == FT_PIXEL_MODE_GRAY) {
                PlacedGlyph g;
                g.x = static_cast<int>(pen >> 6) + slot->bitmap_left;
                g.y = -slot->bitmap_top;
                g.width = static_cast<int>(bitmap.width);
                g.rows = static_cast<int>(bitmap.rows);
                g.alpha.resize(static_cast<size_t>(g.width) * g.rows);
                for (int row = 0; row < g.rows; ++row) {
                    const uint8_t* src = bitmap.buffer + row * bitmap.pitch;
                    std::copy(src, src + g.width, g.alpha.begin() + static_cast<size_t>(row) * g.width);
                }
                minX = std::min(minX, g.x);
                minY = std::min(minY, g.y);
                maxX = std::max(maxX, g.x + g.width);
                maxY = std::max(maxY, g.y + g.rows);
                glyphs.push_back(std::move(g));
            }

            pen += slot->advance.x;
            previous = glyphIndex;
        }

        if (glyphs.empty()) return Ok(std::move(coverage));

        coverage.left = minX;
        coverage.top = minY;
        coverage.width = maxX - minX;
        coverage.height = maxY - minY;
        coverage.alpha.assign(static_cast<size_t>(coverage.width) * coverage.height, 0);
        for (const auto& g : glyphs) {
            for (int row = 0; row < g.rows; ++row) {
                uint8_t* dst = &coverage.alpha[static_cast<size_t>(g.y - minY + row) * coverage.width +
                                               (g.x - minX)];
                const uint8_t* src = &g.alpha[static_cast<size_t>(row) * g.width];
                for (int col = 0; col < g.width; ++col) {
                    dst[col] = std::max(dst[col], src[col]);
                }
            }
        }
        return Ok(std::move(coverage));
    }

private:
    Result<void> openFace(const Font::Ptr& font, float size, ScopedFace& face) {
        if (size <= 0) {
            return Err<void>("font size must be > 0");
        }
        const Font::Ptr& resolved = font ? font : _defaultFont;
        if (!resolved || resolved->path().empty()) {
            return Err<void>("no font file for '" +
                             (resolved ? resolved->family() : std::string("<default>")) + "'");
        }
        FT_Library lib = render::ftLibrary();
        if (!lib) {
            return Err<void>("FreeType library not initialized");
        }
        if (FT_New_Face(lib, resolved->path().c_str(), 0, face.out())) {
            return Err<void>("failed to load font " + resolved->path());
        }
        if (FT_Set_Char_Size(face.get(), 0, static_cast<FT_F26Dot6>(std::lround(size * 64.0f)),
                             72, 72)) {
            return Err<void>("failed to set size " + std::to_string(size) +
                             " on " + resolved->path());
        }
        return Ok();
    }

    Font::Ptr _defaultFont;
};

Result<FreeTypeBackend::Ptr> FreeTypeBackend::createImpl(Font::Ptr defaultFont) {
    auto backend = std::make_shared<FreeTypeBackendImpl>(std::move(defaultFont));
    if (!render::ftLibrary()) {
        return Err<Ptr>("FreeTypeBackend::create: FT_Init_FreeType failed");
    }
    if (backend->defaultFont()) {
        yinfo("FreeTypeBackend: default font '{}' ({})",
              backend->defaultFont()->family(), backend->defaultFont()->path());
    } else {
        ywarn("FreeTypeBackend: no default font configured");
    }
    return Ok(Ptr(std::move(backend)));
}

} // namespace labelkit
