#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace labelkit {

// Decode one codepoint and advance ptr; malformed lead bytes are skipped
uint32_t decodeUtf8(const uint8_t*& ptr, const uint8_t* end);

// Byte offset of each codepoint start, plus a final entry equal to text.size()
std::vector<size_t> utf8Boundaries(const std::string& text);

} // namespace labelkit
