#pragma once

#include <labelkit/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace labelkit::barcode {

// Code 128 symbol values with special meaning
static constexpr uint8_t CODE128_SHIFT_TO_C = 99;
static constexpr uint8_t CODE128_SHIFT_TO_B = 100;
static constexpr uint8_t CODE128_SHIFT_TO_A = 101;
static constexpr uint8_t CODE128_START_A = 103;
static constexpr uint8_t CODE128_START_B = 104;
static constexpr uint8_t CODE128_START_C = 105;
static constexpr uint8_t CODE128_STOP = 106;

//=============================================================================
// Code128Encoder - payload -> symbol values -> module pattern
//
// Code set selection: C for runs of four or more digits (two digits per
// symbol), A for ASCII control characters, B otherwise. Supports ASCII 0..127.
//=============================================================================
class Code128Encoder {
public:
    // Symbol values including start, check and stop symbols
    Result<std::vector<uint8_t>> encodeSymbols(const std::string& payload) const;

    // Module pattern (true = bar), left to right, without quiet zone
    Result<std::vector<bool>> encode(const std::string& payload) const;

    // Bar/space widths of a symbol value (6 entries, 7 for stop)
    static const char* pattern(uint8_t value);

    static uint8_t checksum(const std::vector<uint8_t>& symbols);
};

} // namespace labelkit::barcode
