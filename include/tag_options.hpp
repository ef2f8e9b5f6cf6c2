//
//  tag_options.hpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>

namespace id3forge {

// How frame payloads are written on save.
enum class TextWritePolicy {
    Preserve,  ///< untouched frames keep their bytes; new text is Latin-1 when possible
    Utf16,     ///< every frame is re-encoded as UTF-16BE with BOM
};

// Interpretation of the 4-byte frame size field.
enum class FrameSizeConvention { Syncsafe, BigEndian };

enum class FrameSizeMode {
    Auto,  ///< syncsafe for version 4, big-endian otherwise
    Syncsafe,
    BigEndian,
};

struct TagOptions {
    TextWritePolicy text_policy = TextWritePolicy::Preserve;
    FrameSizeMode frame_size = FrameSizeMode::Auto;
};

inline constexpr FrameSizeConvention resolve_frame_size(FrameSizeMode mode,
                                                        uint8_t major_version) {
    switch (mode) {
        case FrameSizeMode::Syncsafe:
            return FrameSizeConvention::Syncsafe;
        case FrameSizeMode::BigEndian:
            return FrameSizeConvention::BigEndian;
        case FrameSizeMode::Auto:
            break;
    }
    return major_version == 4 ? FrameSizeConvention::Syncsafe : FrameSizeConvention::BigEndian;
}

}  // namespace id3forge
