#include "../include/localocr/base64.hpp"

#include <array>
#include <cstdint>

namespace localocr {

namespace {

constexpr const char kBase64Chars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::uint8_t kInvalid = 0xFF;

constexpr std::array<std::uint8_t, 256> make_decoding_table() {
    std::array<std::uint8_t, 256> table{};
    for (auto& entry : table) {
        entry = kInvalid;
    }
    for (std::uint8_t i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kBase64Chars[i])] = i;
    }
    return table;
}

constexpr auto kDecodeTable = make_decoding_table();

bool is_space(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

} // namespace

std::optional<std::vector<unsigned char>> base64_decode(std::string_view encoded) {
    std::vector<unsigned char> result;
    result.reserve((encoded.size() / 4) * 3);

    std::uint32_t accum = 0;
    int bits = 0;
    std::size_t symbols = 0;
    std::size_t padding = 0;
    for (const char ch : encoded) {
        if (is_space(ch)) {
            continue;
        }
        if (ch == '=') {
            ++padding;
            if (padding > 2) {
                return std::nullopt;
            }
            continue;
        }
        if (padding > 0) {
            return std::nullopt;
        }
        const std::uint8_t val = kDecodeTable[static_cast<unsigned char>(ch)];
        if (val == kInvalid) {
            return std::nullopt;
        }
        ++symbols;
        accum = (accum << 6) | val;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<unsigned char>((accum >> bits) & 0xFF));
        }
    }

    if ((symbols + padding) % 4 != 0) {
        return std::nullopt;
    }
    // A lone trailing symbol cannot encode a whole byte.
    if (symbols % 4 == 1) {
        return std::nullopt;
    }
    if (padding > 0 && padding != (4 - symbols % 4) % 4) {
        return std::nullopt;
    }
    return result;
}

} // namespace localocr
