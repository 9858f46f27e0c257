#include <labelkit/pixmap.h>
#include <cstring>

namespace labelkit {

Pixmap::Pixmap(int width, int height)
    : _width(width)
    , _height(height)
    , _pixels(static_cast<size_t>(width) * static_cast<size_t>(height) * 4, 0) {}

Result<Pixmap::Ptr> Pixmap::createImpl(int width, int height) {
    if (width <= 0 || height <= 0) {
        return Err<Ptr>("Pixmap::create: dimensions must be > 0, got " +
                        std::to_string(width) + "x" + std::to_string(height));
    }
    return Ok(Ptr(new Pixmap(width, height)));
}

Result<Pixmap::Ptr> Pixmap::createImpl(int width, int height, const uint8_t* rgba) {
    if (!rgba) {
        return Err<Ptr>("Pixmap::create: null pixel data");
    }
    auto res = createImpl(width, height);
    if (!res) {
        return res;
    }
    std::memcpy((*res)->data(), rgba, (*res)->byteSize());
    return res;
}

Color Pixmap::pixel(int x, int y) const {
    if (!contains(x, y)) return COLOR_TRANSPARENT;
    const uint8_t* p = &_pixels[(static_cast<size_t>(y) * _width + x) * 4];
    return rgba(p[0], p[1], p[2], p[3]);
}

void Pixmap::setPixel(int x, int y, Color color) {
    if (!contains(x, y)) return;
    uint8_t* p = &_pixels[(static_cast<size_t>(y) * _width + x) * 4];
    p[0] = colorR(color);
    p[1] = colorG(color);
    p[2] = colorB(color);
    p[3] = colorA(color);
}

void Pixmap::blend(int x, int y, Color color, uint8_t coverage) {
    if (!contains(x, y)) return;
    uint32_t sa = (static_cast<uint32_t>(colorA(color)) * coverage + 127) / 255;
    if (sa == 0) return;

    uint8_t* p = &_pixels[(static_cast<size_t>(y) * _width + x) * 4];
    if (sa == 255) {
        p[0] = colorR(color);
        p[1] = colorG(color);
        p[2] = colorB(color);
        p[3] = 255;
        return;
    }

    // Non-premultiplied source-over
    float srcA = sa / 255.0f;
    float dstA = p[3] / 255.0f;
    float outA = srcA + dstA * (1.0f - srcA);
    const uint8_t src[3] = {colorR(color), colorG(color), colorB(color)};
    for (int i = 0; i < 3; i++) {
        float c = (src[i] * srcA + p[i] * dstA * (1.0f - srcA)) / outA;
        p[i] = static_cast<uint8_t>(c + 0.5f);
    }
    p[3] = static_cast<uint8_t>(outA * 255.0f + 0.5f);
}

void Pixmap::fill(Color color) {
    for (size_t i = 0; i < _pixels.size(); i += 4) {
        _pixels[i + 0] = colorR(color);
        _pixels[i + 1] = colorG(color);
        _pixels[i + 2] = colorB(color);
        _pixels[i + 3] = colorA(color);
    }
}

} // namespace labelkit
