#pragma once

#include <labelkit/pixmap.h>
#include <labelkit/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace labelkit {

// Decode PNG/JPEG/BMP/GIF/TGA data into an RGBA pixmap
Result<Pixmap::Ptr> decodeImage(const uint8_t* data, size_t size);
Result<Pixmap::Ptr> loadImage(const std::string& path);

Result<std::vector<uint8_t>> encodePng(const Pixmap& pixmap);
Result<void> writePng(const Pixmap& pixmap, const std::string& path);

} // namespace labelkit
