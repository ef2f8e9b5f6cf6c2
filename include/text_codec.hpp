//
//  text_codec.hpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace id3forge {

// Payload encodings a frame can carry. Selected per frame by BOM sniffing.
enum class TextEncoding { Latin1, Utf16BigEndian, Utf16LittleEndian };

std::string_view encoding_name(TextEncoding encoding);

inline constexpr uint32_t kReplacementChar = 0xFFFD;

// Decode the UTF-8 code point starting at `pos` and advance past it.
// Malformed sequences yield U+FFFD and consume one byte.
uint32_t next_codepoint(std::string_view text, size_t &pos);

void append_utf8(std::string &out, uint32_t codepoint);

// Decode UTF-16 code units (no BOM) to UTF-8, stopping at a 0x0000 unit.
std::string utf16_to_utf8(const uint8_t *data, size_t size, bool big_endian);

// Append the UTF-16 code units of a UTF-8 string (no BOM, no terminator).
void append_utf16(std::vector<uint8_t> &out, std::string_view text, bool big_endian);

// FE FF -> big endian, FF FE -> little endian, otherwise nullopt.
std::optional<TextEncoding> sniff_bom(const std::vector<uint8_t> &payload);

// BOM + code units + 0x0000 terminator.
std::vector<uint8_t> encode_utf16_payload(std::string_view text, bool big_endian);

}  // namespace id3forge
