#pragma once

#include <labelkit/result.hpp>
#include <cstdint>
#include <string>

namespace labelkit {

//=============================================================================
// Colors - packed RGBA, byte order of an RGBA8 buffer (r is the low byte)
//=============================================================================
using Color = uint32_t;

constexpr Color rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
    return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(b) << 16) |
           (static_cast<uint32_t>(g) << 8) | static_cast<uint32_t>(r);
}

constexpr uint8_t colorR(Color c) { return c & 0xFF; }
constexpr uint8_t colorG(Color c) { return (c >> 8) & 0xFF; }
constexpr uint8_t colorB(Color c) { return (c >> 16) & 0xFF; }
constexpr uint8_t colorA(Color c) { return (c >> 24) & 0xFF; }

static constexpr Color COLOR_WHITE = rgba(255, 255, 255);
static constexpr Color COLOR_BLACK = rgba(0, 0, 0);
static constexpr Color COLOR_TRANSPARENT = rgba(0, 0, 0, 0);

// "#RGB", "#RRGGBB" or "#RRGGBBAA"
Result<Color> parseColor(const std::string& str);

// Always "#RRGGBBAA"
std::string formatColor(Color color);

//=============================================================================
// Horizontal alignment applied by LabelBuilder on insertion
//=============================================================================
enum class HAlign : uint8_t {
    None,    // keep requested x
    Left,
    Center,
    Right,
};

//=============================================================================
// Rect - position and size in label units
//=============================================================================
struct Rect {
    float x = 0;
    float y = 0;
    float width = 0;
    float height = 0;

    float right() const { return x + width; }
    float bottom() const { return y + height; }
};

} // namespace labelkit
