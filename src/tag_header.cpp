//
//  tag_header.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tag_header.hpp"

#include "byte_stream.hpp"
#include "int_codec.hpp"

namespace id3forge {

HeaderFlags HeaderFlags::decode(uint8_t byte) {
    HeaderFlags f;
    f.has_experimental_indicator = check_bit(byte, 7);
    f.has_extended_header = check_bit(byte, 6);
    f.has_unsynchronization = check_bit(byte, 5);
    f.raw = byte;
    return f;
}

std::vector<uint8_t> TagHeader::serialize(uint32_t tag_size) const {
    std::vector<uint8_t> out;
    out.reserve(kTagHeaderSize + extended_header.size());
    out.push_back('I');
    out.push_back('D');
    out.push_back('3');
    out.push_back(static_cast<uint8_t>(version & 0xFF));
    out.push_back(static_cast<uint8_t>(version >> 8));
    out.push_back(flags.raw);
    append_bytes(out, encode_syncsafe(tag_size));
    out.insert(out.end(), extended_header.begin(), extended_header.end());
    return out;
}

bool TagHeader::write(std::ostream &out, uint32_t tag_size) const {
    return write_bytes(out, serialize(tag_size));
}

std::optional<TagHeader> parse_tag_header(std::istream &in, Logger &log, TagStatus &status) {
    uint8_t buf[kTagHeaderSize];
    if (!read_exact(in, buf, sizeof(buf))) {
        ID3F_LOG(log, "error", "could not read the ID3v2 header, file ended too soon");
        status = tag_failure(TagError::ShortRead, "file ended inside the ID3v2 header");
        return std::nullopt;
    }
    if (buf[0] != 'I' || buf[1] != 'D' || buf[2] != '3') {
        ID3F_LOG(log, "error", "invalid header, it does not start with \"ID3\"");
        status = tag_failure(TagError::BadMagic, "no ID3v2 tag at start of file");
        return std::nullopt;
    }

    TagHeader header;
    header.version = static_cast<uint16_t>((buf[4] << 8) + buf[3]);
    if (header.version != kSupportedMajorVersion) {
        ID3F_LOG(log, "warn", "header version is " << header.version
                                  << ", but only version " << int(kSupportedMajorVersion)
                                  << " is supported");
    }

    header.flags = HeaderFlags::decode(buf[5]);
    if (header.flags.has_unofficial_bits()) {
        ID3F_LOG(log, "warn", "header has unofficial flag bits set");
    }

    const Bytes4 size_bytes{buf[6], buf[7], buf[8], buf[9]};
    if (!is_valid_syncsafe(size_bytes)) {
        ID3F_LOG(log, "warn", "header size is not properly represented as a syncsafe integer");
    }
    header.size = decode_syncsafe(size_bytes);
    ID3F_LOG(log, "debug", "ID3v2." << int(header.major_version()) << "."
                                    << int(header.revision()) << " tag, size=" << header.size
                                    << " flags=0x" << std::hex << int(header.flags.raw));

    if (header.flags.has_extended_header) {
        Bytes4 ext_size_bytes{};
        if (!read_exact(in, ext_size_bytes.data(), ext_size_bytes.size())) {
            ID3F_LOG(log, "error",
                     "could not read the extended header's size, file ended too soon");
            status = tag_failure(TagError::ShortRead, "file ended inside the extended header");
            return std::nullopt;
        }
        const uint32_t ext_size = decode_syncsafe(ext_size_bytes);
        if (ext_size > header.size) {
            ID3F_LOG(log, "warn", "extended header claims " << ext_size
                                      << " bytes, more than the whole tag (" << header.size
                                      << ")");
        }
        const auto left = remaining_bytes(in);
        std::optional<std::vector<uint8_t>> body;
        if (!left || ext_size <= *left) {
            body = read_bytes(in, ext_size);
        }
        if (!body) {
            ID3F_LOG(log, "error", "extended header body truncated (" << ext_size << " bytes)");
            status = tag_failure(TagError::ShortRead, "file ended inside the extended header");
            return std::nullopt;
        }
        header.extended_header.assign(ext_size_bytes.begin(), ext_size_bytes.end());
        header.extended_header.insert(header.extended_header.end(), body->begin(), body->end());
        ID3F_LOG(log, "debug", "skipped extended header of " << ext_size << " bytes");
    }

    status = tag_ok();
    return header;
}

}  // namespace id3forge
