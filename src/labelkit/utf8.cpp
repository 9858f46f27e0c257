#include "utf8.h"

namespace labelkit {

uint32_t decodeUtf8(const uint8_t*& ptr, const uint8_t* end) {
    uint32_t cp = 0;
    if ((*ptr & 0x80) == 0) {
        cp = *ptr++;
    } else if ((*ptr & 0xE0) == 0xC0) {
        cp = (*ptr++ & 0x1F) << 6;
        if (ptr < end) cp |= (*ptr++ & 0x3F);
    } else if ((*ptr & 0xF0) == 0xE0) {
        cp = (*ptr++ & 0x0F) << 12;
        if (ptr < end) cp |= (*ptr++ & 0x3F) << 6;
        if (ptr < end) cp |= (*ptr++ & 0x3F);
    } else if ((*ptr & 0xF8) == 0xF0) {
        cp = (*ptr++ & 0x07) << 18;
        if (ptr < end) cp |= (*ptr++ & 0x3F) << 12;
        if (ptr < end) cp |= (*ptr++ & 0x3F) << 6;
        if (ptr < end) cp |= (*ptr++ & 0x3F);
    } else {
        ptr++;
    }
    return cp;
}

std::vector<size_t> utf8Boundaries(const std::string& text) {
    std::vector<size_t> bounds;
    const uint8_t* begin = reinterpret_cast<const uint8_t*>(text.data());
    const uint8_t* ptr = begin;
    const uint8_t* end = begin + text.size();
    while (ptr < end) {
        bounds.push_back(static_cast<size_t>(ptr - begin));
        decodeUtf8(ptr, end);
    }
    bounds.push_back(text.size());
    return bounds;
}

} // namespace labelkit
