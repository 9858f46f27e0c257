#include <labelkit/barcode.h>
#include "code128.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace labelkit {

const char* symbologyName(Symbology symbology) {
    switch (symbology) {
        case Symbology::Code128: return "CODE_128";
    }
    return "CODE_128";
}

Result<Symbology> parseSymbology(const std::string& name) {
    if (name == "CODE_128") return Ok(Symbology::Code128);
    return Err<Symbology>("parseSymbology: unsupported symbology '" + name + "'");
}

// Lay modules out centered in the widest integer module width that fits
static Result<Pixmap::Ptr> rasterizeModules(const std::vector<bool>& modules,
                                            int width, int height) {
    int codeWidth = static_cast<int>(modules.size());
    int fullWidth = codeWidth + 2 * BARCODE_QUIET_ZONE;
    int outWidth = std::max(width, fullWidth);
    int outHeight = std::max(height, 1);
    int moduleWidth = outWidth / fullWidth;
    int left = (outWidth - codeWidth * moduleWidth) / 2;

    auto res = Pixmap::create(outWidth, outHeight);
    if (!res) {
        return Err<Pixmap::Ptr>("encodeBarcode: failed to allocate raster", res);
    }
    Pixmap& pixmap = **res;
    pixmap.fill(COLOR_WHITE);
    for (int m = 0; m < codeWidth; ++m) {
        if (!modules[m]) continue;
        int x0 = left + m * moduleWidth;
        for (int y = 0; y < outHeight; ++y) {
            for (int x = x0; x < x0 + moduleWidth; ++x) {
                pixmap.setPixel(x, y, COLOR_BLACK);
            }
        }
    }
    return res;
}

Result<Pixmap::Ptr> encodeBarcode(const std::string& payload, Symbology symbology,
                                  int width, int height) {
    switch (symbology) {
        case Symbology::Code128: {
            barcode::Code128Encoder encoder;
            auto modules = encoder.encode(payload);
            if (!modules) {
                return Err<Pixmap::Ptr>("encodeBarcode: cannot encode '" + payload + "' as " +
                                        symbologyName(symbology), modules);
            }
            ytrace("encodeBarcode: '{}' -> {} modules", payload, modules->size());
            return rasterizeModules(*modules, width, height);
        }
    }
    return Err<Pixmap::Ptr>("encodeBarcode: unknown symbology");
}

} // namespace labelkit
