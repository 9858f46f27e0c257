#include "code128.h"

namespace labelkit::barcode {

//=============================================================================
// Symbol patterns: bar/space widths, starting with a bar (values 0..106)
//=============================================================================

static const char* const PATTERNS[] = {
    "212222", "222122", "222221", "121223", "121322", "131222", "122213", "122312",
    "132212", "221213", "221312", "231212", "112232", "122132", "122231", "113222",
    "123122", "123221", "223211", "221132", "221231", "213212", "223112", "312131",
    "311222", "321122", "321221", "312212", "322112", "322211", "212123", "212321",
    "232121", "111323", "131123", "131321", "112313", "132113", "132311", "211313",
    "231113", "231311", "112133", "112331", "132131", "113123", "113321", "133121",
    "313121", "211331", "231131", "213113", "213311", "213131", "311123", "311321",
    "331121", "312113", "312311", "332111", "314111", "221411", "431111", "111224",
    "111422", "121124", "121421", "141122", "141221", "112214", "112412", "122114",
    "122411", "142112", "142211", "241211", "221114", "413111", "241112", "134111",
    "111242", "121142", "121241", "114212", "124112", "124211", "411212", "421112",
    "421211", "212141", "214121", "412121", "111143", "111341", "131141", "114113",
    "114311", "411113", "411311", "113141", "114131", "311141", "411131", "211412",
    "211214", "211232", "2331112",
};
static_assert(sizeof(PATTERNS) / sizeof(PATTERNS[0]) == 107, "Code 128 has 107 symbols");

enum class CodeSet { A, B, C };

static bool isDigit(char c) { return c >= '0' && c <= '9'; }

static size_t digitRun(const std::string& s, size_t from) {
    size_t n = 0;
    while (from + n < s.size() && isDigit(s[from + n])) n++;
    return n;
}

static uint8_t valueInSet(CodeSet set, uint8_t ch) {
    if (set == CodeSet::A) {
        return ch < 32 ? static_cast<uint8_t>(ch + 64) : static_cast<uint8_t>(ch - 32);
    }
    return static_cast<uint8_t>(ch - 32);
}

const char* Code128Encoder::pattern(uint8_t value) {
    return value < 107 ? PATTERNS[value] : nullptr;
}

uint8_t Code128Encoder::checksum(const std::vector<uint8_t>& symbols) {
    if (symbols.empty()) return 0;
    uint32_t sum = symbols[0];
    for (size_t i = 1; i < symbols.size(); ++i) {
        sum += static_cast<uint32_t>(symbols[i]) * static_cast<uint32_t>(i);
    }
    return static_cast<uint8_t>(sum % 103);
}

Result<std::vector<uint8_t>> Code128Encoder::encodeSymbols(const std::string& payload) const {
    if (payload.empty()) {
        return Err<std::vector<uint8_t>>("Code128: empty payload");
    }
    for (size_t i = 0; i < payload.size(); ++i) {
        if (static_cast<uint8_t>(payload[i]) > 127) {
            return Err<std::vector<uint8_t>>("Code128: non-ASCII byte at position " +
                                             std::to_string(i));
        }
    }

    std::vector<uint8_t> symbols;
    CodeSet set;
    size_t leading = digitRun(payload, 0);
    if (leading >= 4 || (leading == payload.size() && leading % 2 == 0)) {
        set = CodeSet::C;
        symbols.push_back(CODE128_START_C);
    } else if (static_cast<uint8_t>(payload[0]) < 32) {
        set = CodeSet::A;
        symbols.push_back(CODE128_START_A);
    } else {
        set = CodeSet::B;
        symbols.push_back(CODE128_START_B);
    }

    size_t i = 0;
    while (i < payload.size()) {
        if (set == CodeSet::C) {
            if (digitRun(payload, i) >= 2) {
                symbols.push_back(static_cast<uint8_t>((payload[i] - '0') * 10 + (payload[i + 1] - '0')));
                i += 2;
                continue;
            }
            if (static_cast<uint8_t>(payload[i]) < 32) {
                symbols.push_back(CODE128_SHIFT_TO_A);
                set = CodeSet::A;
            } else {
                symbols.push_back(CODE128_SHIFT_TO_B);
                set = CodeSet::B;
            }
        }

        size_t run = digitRun(payload, i);
        if (run >= 4 && run % 2 == 0) {
            symbols.push_back(CODE128_SHIFT_TO_C);
            set = CodeSet::C;
            continue;
        }

        auto ch = static_cast<uint8_t>(payload[i]);
        if (set == CodeSet::A && ch >= 96) {
            symbols.push_back(CODE128_SHIFT_TO_B);
            set = CodeSet::B;
        } else if (set == CodeSet::B && ch < 32) {
            symbols.push_back(CODE128_SHIFT_TO_A);
            set = CodeSet::A;
        }
        symbols.push_back(valueInSet(set, ch));
        i++;
    }

    symbols.push_back(checksum(symbols));
    symbols.push_back(CODE128_STOP);
    return Ok(std::move(symbols));
}

Result<std::vector<bool>> Code128Encoder::encode(const std::string& payload) const {
    auto symbols = encodeSymbols(payload);
    if (!symbols) {
        return Err<std::vector<bool>>("Code128Encoder::encode", symbols);
    }

    std::vector<bool> modules;
    for (uint8_t value : *symbols) {
        bool bar = true;
        for (const char* w = pattern(value); *w; ++w) {
            modules.insert(modules.end(), static_cast<size_t>(*w - '0'), bar);
            bar = !bar;
        }
    }
    return Ok(std::move(modules));
}

} // namespace labelkit::barcode
