#include <labelkit/image-codec.h>
#include <ytrace/ytrace.hpp>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <fstream>
#include <iterator>
#include <limits>

namespace labelkit {

Result<Pixmap::Ptr> decodeImage(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return Err<Pixmap::Ptr>("decodeImage: empty input");
    }
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Err<Pixmap::Ptr>("decodeImage: input too large");
    }

    int width = 0, height = 0, channels = 0;
    uint8_t* pixels = stbi_load_from_memory(data, static_cast<int>(size),
                                            &width, &height, &channels, 4);
    if (!pixels) {
        return Err<Pixmap::Ptr>(std::string("decodeImage: stbi_load failed: ") +
                                stbi_failure_reason());
    }

    auto res = Pixmap::create(width, height, static_cast<const uint8_t*>(pixels));
    stbi_image_free(pixels);
    if (!res) {
        return Err<Pixmap::Ptr>("decodeImage: failed to allocate pixmap", res);
    }
    ydebug("decodeImage: {}x{} ({} source channels)", width, height, channels);
    return res;
}

Result<Pixmap::Ptr> loadImage(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return Err<Pixmap::Ptr>("loadImage: cannot open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    auto res = decodeImage(bytes.data(), bytes.size());
    if (!res) {
        return Err<Pixmap::Ptr>("loadImage: " + path, res);
    }
    return res;
}

static void appendToVector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

Result<std::vector<uint8_t>> encodePng(const Pixmap& pixmap) {
    std::vector<uint8_t> out;
    if (!stbi_write_png_to_func(appendToVector, &out, pixmap.width(), pixmap.height(),
                                4, pixmap.data(), pixmap.width() * 4)) {
        return Err<std::vector<uint8_t>>("encodePng: stbi_write_png_to_func failed");
    }
    return Ok(std::move(out));
}

Result<void> writePng(const Pixmap& pixmap, const std::string& path) {
    if (!stbi_write_png(path.c_str(), pixmap.width(), pixmap.height(), 4,
                        pixmap.data(), pixmap.width() * 4)) {
        return Err<void>("writePng: failed to write " + path);
    }
    yinfo("writePng: wrote {}x{} to {}", pixmap.width(), pixmap.height(), path);
    return Ok();
}

} // namespace labelkit
