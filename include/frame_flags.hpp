//
//  frame_flags.hpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace id3forge {

/**
 * @brief Decoded view of the two frame flag bytes.
 *
 * `raw` is what gets written back; the booleans are never re-encoded.
 */
struct FrameFlags {
    bool tag_alter_preservation = false;   ///< byte 0, bit 7
    bool file_alter_preservation = false;  ///< byte 0, bit 6
    bool read_only = false;                ///< byte 0, bit 5
    bool compression = false;              ///< byte 1, bit 7
    bool encryption = false;               ///< byte 1, bit 6
    bool grouping_identity = false;        ///< byte 1, bit 5
    std::array<uint8_t, 2> raw{0, 0};

    static FrameFlags decode(uint8_t status, uint8_t format);

    // Any of bits 0-4 set in either byte.
    bool has_unofficial_bits() const;

    // "(read-only, compression)" or "" when nothing is set.
    std::string format_human() const;

    // Six characters "rcefrg", '.' for unset flags.
    std::string format_compact() const;
};

}  // namespace id3forge
