#include <labelkit/types.h>
#include <cstdio>

namespace labelkit {

static int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Result<Color> parseColor(const std::string& str) {
    if (str.empty() || str[0] != '#') {
        return Err<Color>("parseColor: expected '#RRGGBB[AA]', got '" + str + "'");
    }
    std::string hex = str.substr(1);
    if (hex.size() == 3) hex = std::string{hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
    if (hex.size() == 6) hex += "FF";
    if (hex.size() != 8) {
        return Err<Color>("parseColor: bad length in '" + str + "'");
    }

    uint8_t bytes[4];
    for (int i = 0; i < 4; i++) {
        int hi = hexDigit(hex[i * 2]);
        int lo = hexDigit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return Err<Color>("parseColor: invalid hex digit in '" + str + "'");
        }
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Ok(rgba(bytes[0], bytes[1], bytes[2], bytes[3]));
}

std::string formatColor(Color color) {
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X%02X",
                  colorR(color), colorG(color), colorB(color), colorA(color));
    return buf;
}

} // namespace labelkit
