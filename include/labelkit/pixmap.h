#pragma once

#include <labelkit/base/object.h>
#include <labelkit/base/factory.h>
#include <labelkit/result.hpp>
#include <labelkit/types.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace labelkit {

//=============================================================================
// Pixmap - owned RGBA8 pixel buffer, row-major, no padding
//=============================================================================
class Pixmap : public base::Object,
               public base::ObjectFactory<Pixmap> {
public:
    using Ptr = std::shared_ptr<Pixmap>;

    // Transparent black pixels; both dimensions must be > 0
    static Result<Ptr> createImpl(int width, int height);
    // Copies width * height * 4 bytes from rgba
    static Result<Ptr> createImpl(int width, int height, const uint8_t* rgba);

    ~Pixmap() override = default;
    const char* typeName() const override { return "Pixmap"; }

    int width() const { return _width; }
    int height() const { return _height; }
    size_t byteSize() const { return _pixels.size(); }
    uint8_t* data() { return _pixels.data(); }
    const uint8_t* data() const { return _pixels.data(); }

    bool contains(int x, int y) const {
        return x >= 0 && y >= 0 && x < _width && y < _height;
    }

    // Out-of-range reads return transparent, writes are ignored
    Color pixel(int x, int y) const;
    void setPixel(int x, int y, Color color);

    // Source-over composite of color, its alpha scaled by coverage (0..255)
    void blend(int x, int y, Color color, uint8_t coverage = 255);

    void fill(Color color);

private:
    Pixmap(int width, int height);

    int _width;
    int _height;
    std::vector<uint8_t> _pixels;
};

} // namespace labelkit
