//
//  frame_id.hpp
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

#include "int_codec.hpp"

// Frame ID character class: uppercase A-Z or digit 0-9.
inline constexpr bool is_frame_id_char(uint8_t c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

inline constexpr bool looks_like_frame_id(const Bytes4 &b) {
    return is_frame_id_char(b[0]) && is_frame_id_char(b[1]) && is_frame_id_char(b[2]) &&
           is_frame_id_char(b[3]);
}

inline bool is_valid_frame_id(std::string_view id) {
    if (id.size() != 4) {
        return false;
    }
    for (char c : id) {
        if (!is_frame_id_char(static_cast<uint8_t>(c))) {
            return false;
        }
    }
    return true;
}

// True for a valid ID listed in the ID3v2.3/2.4 frame table.
bool is_known_frame_id(std::string_view id);

// Human description for a known ID ("TIT2" -> "Title/songname/content description").
std::optional<std::string_view> frame_description(std::string_view id);
