#pragma once

#include <labelkit/pixmap.h>
#include <labelkit/result.hpp>
#include <cstdint>
#include <string>

namespace labelkit {

enum class Symbology : uint8_t {
    Code128,
};

// Persisted names ("CODE_128")
const char* symbologyName(Symbology symbology);
Result<Symbology> parseSymbology(const std::string& name);

// Quiet zone on each side of a linear symbol, in modules
static constexpr int BARCODE_QUIET_ZONE = 10;

// Render payload as a black-on-white raster of at least width x height pixels.
// Fails when the symbology cannot represent the payload.
Result<Pixmap::Ptr> encodeBarcode(const std::string& payload, Symbology symbology,
                                  int width, int height);

} // namespace labelkit
