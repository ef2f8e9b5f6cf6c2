//
//  tag_frame.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tag_frame.hpp"

#include "byte_stream.hpp"
#include "frame_id.hpp"
#include "int_codec.hpp"
#include "latin1.hpp"

namespace id3forge {

namespace {

// Frame IDs must be UTF-8 text; anything that decodes to U+FFFD is rejected.
bool id_bytes_are_text(const Bytes4 &b) {
    const std::string_view raw(reinterpret_cast<const char *>(b.data()), b.size());
    size_t pos = 0;
    while (pos < raw.size()) {
        if (next_codepoint(raw, pos) == kReplacementChar) {
            return false;
        }
    }
    return true;
}

std::string decode_payload(const std::vector<uint8_t> &payload, TextEncoding encoding,
                           const std::string &id, Logger &log) {
    switch (encoding) {
        case TextEncoding::Utf16BigEndian:
            return utf16_to_utf8(payload.data() + 2, payload.size() - 2, true);
        case TextEncoding::Utf16LittleEndian:
            return utf16_to_utf8(payload.data() + 2, payload.size() - 2, false);
        case TextEncoding::Latin1:
            break;
    }
    if (auto text = latin1::decode(payload)) {
        return *text;
    }
    // NUL separators/terminators or unmapped bytes; not part of the displayed text.
    ID3F_LOG(log, "debug", "frame " << id << " payload decoded lossily");
    return latin1::decode_lossy(payload);
}

}  // namespace

std::pair<TextEncoding, std::vector<uint8_t>> encode_text_for_write(const std::string &text) {
    if (auto bytes = latin1::encode(text)) {
        return {TextEncoding::Latin1, std::move(*bytes)};
    }
    return {TextEncoding::Utf16BigEndian, encode_utf16_payload(text, true)};
}

Frame Frame::from_user_input(std::string id, std::string data) {
    Frame f;
    f.id = std::move(id);
    f.edit_data(std::move(data));
    return f;
}

void Frame::edit_data(std::string new_data) {
    auto [enc, bytes] = encode_text_for_write(new_data);
    data = std::move(new_data);
    encoding = enc;
    payload = std::move(bytes);
    size = static_cast<uint32_t>(payload.size());
}

std::vector<uint8_t> Frame::encoded_payload(TextWritePolicy policy) const {
    if (policy == TextWritePolicy::Utf16) {
        return encode_utf16_payload(data, true);
    }
    return payload;
}

uint32_t Frame::encoded_size(TextWritePolicy policy) const {
    if (policy == TextWritePolicy::Utf16) {
        return static_cast<uint32_t>(encoded_payload(policy).size());
    }
    return size;
}

std::vector<uint8_t> Frame::serialize(FrameSizeConvention convention,
                                      TextWritePolicy policy) const {
    const std::vector<uint8_t> body = encoded_payload(policy);
    const auto body_size = static_cast<uint32_t>(body.size());

    std::vector<uint8_t> out;
    out.reserve(kFrameHeaderSize + body.size());
    for (size_t i = 0; i < 4; ++i) {
        out.push_back(i < id.size() ? static_cast<uint8_t>(id[i]) : static_cast<uint8_t>(' '));
    }
    append_bytes(out, convention == FrameSizeConvention::Syncsafe ? encode_syncsafe(body_size)
                                                                  : encode_be32(body_size));
    out.push_back(flags.raw[0]);
    out.push_back(flags.raw[1]);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

bool Frame::write(std::ostream &out, FrameSizeConvention convention,
                  TextWritePolicy policy) const {
    return write_bytes(out, serialize(convention, policy));
}

bool next_is_frame(std::istream &in) {
    const auto b = peek4(in);
    return b && looks_like_frame_id(*b);
}

std::optional<Frame> parse_frame(std::istream &in, FrameSizeConvention convention, Logger &log,
                                 TagStatus &status) {
    uint8_t header[kFrameHeaderSize];
    if (!read_exact(in, header, sizeof(header))) {
        ID3F_LOG(log, "error", "failed to read frame header, file ended too soon");
        status = tag_failure(TagError::ShortRead, "file ended inside a frame header");
        return std::nullopt;
    }

    const Bytes4 id_bytes{header[0], header[1], header[2], header[3]};
    if (!id_bytes_are_text(id_bytes)) {
        ID3F_LOG(log, "error", "failed to read frame id, bytes are not valid text");
        status = tag_failure(TagError::BadFrameId, "frame id is not valid text");
        return std::nullopt;
    }

    Frame frame;
    frame.id.assign(reinterpret_cast<const char *>(id_bytes.data()), id_bytes.size());
    if (!is_valid_frame_id(frame.id)) {
        ID3F_LOG(log, "warn", "frame id \"" << frame.id << "\" is not a valid frame id");
    } else if (!is_known_frame_id(frame.id)) {
        ID3F_LOG(log, "warn",
                 "frame id \"" << frame.id << "\" is valid, but not a known frame id");
    }

    const Bytes4 size_bytes{header[4], header[5], header[6], header[7]};
    if (convention == FrameSizeConvention::Syncsafe) {
        if (!is_valid_syncsafe(size_bytes)) {
            ID3F_LOG(log, "warn", "frame " << frame.id
                                      << " size is not properly represented as a syncsafe "
                                         "integer");
        }
        frame.size = decode_syncsafe(size_bytes);
    } else {
        frame.size = decode_be32(size_bytes);
    }

    frame.flags = FrameFlags::decode(header[8], header[9]);
    if (frame.flags.has_unofficial_bits()) {
        ID3F_LOG(log, "warn", "frame " << frame.id << " has unofficial flag bits set");
    }

    const auto left = remaining_bytes(in);
    std::optional<std::vector<uint8_t>> payload;
    if (!left || frame.size <= *left) {
        payload = read_bytes(in, frame.size);
    }
    if (!payload) {
        ID3F_LOG(log, "error", "failed to read data of frame " << frame.id << " ("
                                                               << frame.size
                                                               << " bytes), file ended too soon");
        status = tag_failure(TagError::ShortRead, "file ended inside frame " + frame.id);
        return std::nullopt;
    }
    frame.payload = std::move(*payload);

    if (auto bom = sniff_bom(frame.payload)) {
        frame.encoding = *bom;
    } else {
        frame.encoding = TextEncoding::Latin1;
        if (!latin1::is_valid(frame.payload)) {
            ID3F_LOG(log, "warn", "data for frame " << frame.id
                                      << " is neither valid ISO-8859-1 nor marked as UTF-16, "
                                         "treating it as ISO-8859-1 anyway");
        }
    }
    frame.data = decode_payload(frame.payload, frame.encoding, frame.id, log);

    ID3F_LOG(log, "debug", "frame " << frame.id << " size=" << frame.size << " enc="
                                    << encoding_name(frame.encoding)
                                    << " bytes=" << hex_prefix(frame.payload));
    status = tag_ok();
    return frame;
}

}  // namespace id3forge
