//
//  tag_frame.hpp
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
#include <string>
#include <utility>
#include <vector>

#include "frame_flags.hpp"
#include "logging.hpp"
#include "tag_options.hpp"
#include "tag_status.hpp"
#include "text_codec.hpp"

namespace id3forge {

inline constexpr size_t kFrameHeaderSize = 10;

/**
 * @brief One frame record: 4-byte ID, size, two flag bytes and payload.
 *
 * `data` is the decoded payload as UTF-8 and `encoding` records how the
 * payload was (or will be) encoded. `payload` holds the bytes written back
 * under TextWritePolicy::Preserve, and `size` is always `payload.size()`.
 */
class Frame {
   public:
    std::string id;
    uint32_t size = 0;
    FrameFlags flags;
    std::string data;
    TextEncoding encoding = TextEncoding::Latin1;
    std::vector<uint8_t> payload;

    // New frame from an ID and text; flags are zero.
    static Frame from_user_input(std::string id, std::string data);

    // Replace the text and re-encode the payload.
    void edit_data(std::string new_data);

    std::vector<uint8_t> encoded_payload(TextWritePolicy policy) const;
    uint32_t encoded_size(TextWritePolicy policy) const;

    // Frame header + payload as written to the file.
    std::vector<uint8_t> serialize(FrameSizeConvention convention, TextWritePolicy policy) const;
    bool write(std::ostream &out, FrameSizeConvention convention, TextWritePolicy policy) const;
};

// Latin-1 when every character fits, UTF-16BE with BOM otherwise.
std::pair<TextEncoding, std::vector<uint8_t>> encode_text_for_write(const std::string &text);

// True when the next four bytes look like a frame ID. Does not consume input.
bool next_is_frame(std::istream &in);

// Parse one frame at the current position. On failure `status` carries the reason.
std::optional<Frame> parse_frame(std::istream &in, FrameSizeConvention convention, Logger &log,
                                 TagStatus &status);

}  // namespace id3forge
