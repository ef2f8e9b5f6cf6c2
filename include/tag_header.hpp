//
//  tag_header.hpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <vector>

#include "logging.hpp"
#include "tag_options.hpp"
#include "tag_status.hpp"

namespace id3forge {

inline constexpr size_t kTagHeaderSize = 10;
inline constexpr uint8_t kSupportedMajorVersion = 4;

struct HeaderFlags {
    bool has_experimental_indicator = false;  // bit 7
    bool has_extended_header = false;         // bit 6
    bool has_unsynchronization = false;       // bit 5
    uint8_t raw = 0;

    static HeaderFlags decode(uint8_t byte);
    bool has_unofficial_bits() const { return (raw & 0x1F) != 0; }
};

struct TagHeader {
    // (revision << 8) | major, as packed from header bytes 3 and 4.
    uint16_t version = kSupportedMajorVersion;
    HeaderFlags flags;
    // Size as read from the file; save() recomputes it from the frames.
    uint32_t size = 0;
    // Extended header bytes (size field + body), written back unchanged.
    std::vector<uint8_t> extended_header;

    uint8_t major_version() const { return static_cast<uint8_t>(version & 0xFF); }
    uint8_t revision() const { return static_cast<uint8_t>(version >> 8); }

    FrameSizeConvention frame_size_convention(FrameSizeMode mode) const {
        return resolve_frame_size(mode, major_version());
    }

    // 10 header bytes carrying `tag_size`, followed by the extended header.
    std::vector<uint8_t> serialize(uint32_t tag_size) const;
    bool write(std::ostream &out, uint32_t tag_size) const;
};

// Parse the tag header (and skip past any extended header). On failure `status`
// carries the reason and nullopt is returned.
std::optional<TagHeader> parse_tag_header(std::istream &in, Logger &log, TagStatus &status);

}  // namespace id3forge
