//
//  latin1.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "latin1.hpp"

#include <array>

#include "text_codec.hpp"

namespace id3forge::latin1 {

namespace {

constexpr uint16_t kAbsent = 0;

constexpr std::array<uint16_t, 256> make_decode_table() {
    std::array<uint16_t, 256> table{};
    for (unsigned b = 0; b < 256; ++b) {
        const bool printable = (b >= 0x20 && b <= 0x7E) || b >= 0xA0;
        table[b] = printable ? static_cast<uint16_t>(b) : kAbsent;
    }
    return table;
}

constexpr std::array<uint16_t, 256> kDecodeTable = make_decode_table();

constexpr bool is_encodable(uint32_t cp) {
    return (cp >= 0x20 && cp <= 0x7E) || (cp >= 0xA0 && cp <= 0xFF);
}

}  // namespace

std::optional<std::string> decode(const std::vector<uint8_t> &bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t b : bytes) {
        const uint16_t cp = kDecodeTable[b];
        if (cp == kAbsent) {
            return std::nullopt;
        }
        append_utf8(out, cp);
    }
    return out;
}

std::string decode_lossy(const std::vector<uint8_t> &bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t b : bytes) {
        if (b == 0x00) {
            continue;
        }
        const uint16_t cp = kDecodeTable[b];
        append_utf8(out, cp == kAbsent ? kReplacementChar : cp);
    }
    return out;
}

std::optional<std::vector<uint8_t>> encode(std::string_view text) {
    std::vector<uint8_t> out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        const uint32_t cp = next_codepoint(text, pos);
        if (!is_encodable(cp)) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>(cp));
    }
    return out;
}

bool can_encode(std::string_view text) { return encode(text).has_value(); }

bool is_valid(const std::vector<uint8_t> &bytes) {
    for (uint8_t b : bytes) {
        if (b != 0x00 && kDecodeTable[b] == kAbsent) {
            return false;
        }
    }
    return true;
}

}  // namespace id3forge::latin1
