//
//  text_codec.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "text_codec.hpp"

namespace id3forge {

std::string_view encoding_name(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Latin1:
            return "latin1";
        case TextEncoding::Utf16BigEndian:
            return "utf16be";
        case TextEncoding::Utf16LittleEndian:
            return "utf16le";
    }
    return "latin1";
}

uint32_t next_codepoint(std::string_view text, size_t &pos) {
    const auto *p = reinterpret_cast<const uint8_t *>(text.data()) + pos;
    const size_t left = text.size() - pos;
    if (left == 0) {
        return kReplacementChar;
    }
    const uint8_t c = p[0];
    if (c < 0x80) {
        pos += 1;
        return c;
    }
    auto cont = [&](size_t i) { return i < left && (p[i] & 0xC0) == 0x80; };
    if ((c & 0xE0) == 0xC0 && cont(1)) {
        const uint32_t cp = (uint32_t(c & 0x1F) << 6) | (p[1] & 0x3F);
        if (cp >= 0x80) {
            pos += 2;
            return cp;
        }
    } else if ((c & 0xF0) == 0xE0 && cont(1) && cont(2)) {
        const uint32_t cp =
            (uint32_t(c & 0x0F) << 12) | (uint32_t(p[1] & 0x3F) << 6) | (p[2] & 0x3F);
        if (cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF)) {
            pos += 3;
            return cp;
        }
    } else if ((c & 0xF8) == 0xF0 && cont(1) && cont(2) && cont(3)) {
        const uint32_t cp = (uint32_t(c & 0x07) << 18) | (uint32_t(p[1] & 0x3F) << 12) |
                            (uint32_t(p[2] & 0x3F) << 6) | (p[3] & 0x3F);
        if (cp >= 0x10000 && cp <= 0x10FFFF) {
            pos += 4;
            return cp;
        }
    }
    pos += 1;
    return kReplacementChar;
}

void append_utf8(std::string &out, uint32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = kReplacementChar;
    }
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string utf16_to_utf8(const uint8_t *data, size_t size, bool big_endian) {
    auto unit_at = [&](size_t i) -> uint16_t {
        return big_endian ? static_cast<uint16_t>((data[i] << 8) | data[i + 1])
                          : static_cast<uint16_t>(data[i] | (data[i + 1] << 8));
    };
    std::string result;
    result.reserve(size);
    for (size_t i = 0; i + 1 < size; i += 2) {
        const uint16_t unit = unit_at(i);
        if (unit == 0x0000) {
            break;
        }
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            // High surrogate; pair it with the following low surrogate if present.
            if (i + 3 < size) {
                const uint16_t low = unit_at(i + 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    append_utf8(result,
                                0x10000 + ((uint32_t(unit - 0xD800) << 10) | (low - 0xDC00)));
                    i += 2;
                    continue;
                }
            }
            append_utf8(result, kReplacementChar);
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            append_utf8(result, kReplacementChar);
        } else {
            append_utf8(result, unit);
        }
    }
    return result;
}

void append_utf16(std::vector<uint8_t> &out, std::string_view text, bool big_endian) {
    auto push_unit = [&](uint16_t u) {
        if (big_endian) {
            out.push_back(static_cast<uint8_t>(u >> 8));
            out.push_back(static_cast<uint8_t>(u & 0xFF));
        } else {
            out.push_back(static_cast<uint8_t>(u & 0xFF));
            out.push_back(static_cast<uint8_t>(u >> 8));
        }
    };
    size_t pos = 0;
    while (pos < text.size()) {
        const uint32_t cp = next_codepoint(text, pos);
        if (cp >= 0x10000) {
            const uint32_t v = cp - 0x10000;
            push_unit(static_cast<uint16_t>(0xD800 + (v >> 10)));
            push_unit(static_cast<uint16_t>(0xDC00 + (v & 0x3FF)));
        } else {
            push_unit(static_cast<uint16_t>(cp));
        }
    }
}

std::optional<TextEncoding> sniff_bom(const std::vector<uint8_t> &payload) {
    if (payload.size() < 2) {
        return std::nullopt;
    }
    if (payload[0] == 0xFE && payload[1] == 0xFF) {
        return TextEncoding::Utf16BigEndian;
    }
    if (payload[0] == 0xFF && payload[1] == 0xFE) {
        return TextEncoding::Utf16LittleEndian;
    }
    return std::nullopt;
}

std::vector<uint8_t> encode_utf16_payload(std::string_view text, bool big_endian) {
    std::vector<uint8_t> out;
    out.reserve(4 + text.size() * 2);
    if (big_endian) {
        out.push_back(0xFE);
        out.push_back(0xFF);
    } else {
        out.push_back(0xFF);
        out.push_back(0xFE);
    }
    append_utf16(out, text, big_endian);
    out.push_back(0x00);
    out.push_back(0x00);
    return out;
}

}  // namespace id3forge
