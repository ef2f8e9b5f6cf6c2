//
//  latin1.hpp
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

namespace id3forge::latin1 {

// Decode ISO-8859-1 bytes to UTF-8. Fails on 0x00 and on C0/C1 control bytes.
std::optional<std::string> decode(const std::vector<uint8_t> &bytes);

// Lossy variant for payloads that failed validation: NUL bytes are dropped,
// other unmapped bytes become U+FFFD.
std::string decode_lossy(const std::vector<uint8_t> &bytes);

// Encode UTF-8 text; every character must lie in [0x20,0x7E] or [0xA0,0xFF].
std::optional<std::vector<uint8_t>> encode(std::string_view text);

bool can_encode(std::string_view text);

// True iff every byte is 0x00 or a printable ISO-8859-1 code point.
bool is_valid(const std::vector<uint8_t> &bytes);

}  // namespace id3forge::latin1
