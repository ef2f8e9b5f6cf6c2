//
//  int_codec.hpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <vector>

using Bytes4 = std::array<uint8_t, 4>;

// Largest value a syncsafe integer can carry (4 x 7 bits).
inline constexpr uint32_t kSyncsafeMax = 0x0FFFFFFF;

// ------------- Syncsafe integers (7 bits per byte, MSB always 0) -------------

inline constexpr uint32_t decode_syncsafe(const Bytes4 &b) {
    return (uint32_t(b[0] & 0x7F) << 21) | (uint32_t(b[1] & 0x7F) << 14) |
           (uint32_t(b[2] & 0x7F) << 7) | (uint32_t(b[3] & 0x7F));
}

// Bits above 28 are dropped; callers keep values within kSyncsafeMax.
inline constexpr Bytes4 encode_syncsafe(uint32_t v) {
    return {static_cast<uint8_t>((v >> 21) & 0x7F), static_cast<uint8_t>((v >> 14) & 0x7F),
            static_cast<uint8_t>((v >> 7) & 0x7F), static_cast<uint8_t>(v & 0x7F)};
}

inline constexpr bool is_valid_syncsafe(const Bytes4 &b) {
    return ((b[0] | b[1] | b[2] | b[3]) & 0x80) == 0;
}

// ------------- Plain big-endian 32-bit ---------------------------------------

inline constexpr uint32_t decode_be32(const Bytes4 &b) {
    return (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) |
           (uint32_t(b[3]));
}

inline constexpr Bytes4 encode_be32(uint32_t v) {
    return {static_cast<uint8_t>((v >> 24) & 0xFF), static_cast<uint8_t>((v >> 16) & 0xFF),
            static_cast<uint8_t>((v >> 8) & 0xFF), static_cast<uint8_t>(v & 0xFF)};
}

// Bit 0 is the least significant.
inline constexpr bool check_bit(uint8_t byte, unsigned index) { return ((byte >> index) & 1) == 1; }

inline void append_bytes(std::vector<uint8_t> &p, const Bytes4 &b) {
    p.insert(p.end(), b.begin(), b.end());
}
