//
//  frame_flags.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "frame_flags.hpp"

#include <vector>

#include "int_codec.hpp"

namespace id3forge {

FrameFlags FrameFlags::decode(uint8_t status, uint8_t format) {
    FrameFlags f;
    f.tag_alter_preservation = check_bit(status, 7);
    f.file_alter_preservation = check_bit(status, 6);
    f.read_only = check_bit(status, 5);
    f.compression = check_bit(format, 7);
    f.encryption = check_bit(format, 6);
    f.grouping_identity = check_bit(format, 5);
    f.raw = {status, format};
    return f;
}

bool FrameFlags::has_unofficial_bits() const { return ((raw[0] | raw[1]) & 0x1F) != 0; }

std::string FrameFlags::format_human() const {
    std::vector<const char *> names;
    if (read_only) names.push_back("read-only");
    if (compression) names.push_back("compression");
    if (encryption) names.push_back("encryption");
    if (file_alter_preservation) names.push_back("file-alter-preservation");
    if (tag_alter_preservation) names.push_back("tag-alter-preservation");
    if (grouping_identity) names.push_back("grouping-identity");
    if (names.empty()) {
        return {};
    }
    std::string out = "(";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += names[i];
    }
    out += ")";
    return out;
}

std::string FrameFlags::format_compact() const {
    // Tag-alter shares 'r' with read-only.
    std::string out(6, '.');
    if (read_only) out[0] = 'r';
    if (compression) out[1] = 'c';
    if (encryption) out[2] = 'e';
    if (file_alter_preservation) out[3] = 'f';
    if (tag_alter_preservation) out[4] = 'r';
    if (grouping_identity) out[5] = 'g';
    return out;
}

}  // namespace id3forge
