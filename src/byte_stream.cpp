//
//  byte_stream.cpp
//  ID3Forge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "byte_stream.hpp"

namespace {

constexpr size_t kCopyChunk = 64 * 1024;

}  // namespace

bool read_exact(std::istream &in, uint8_t *dst, size_t n) {
    if (n == 0) {
        return true;
    }
    in.read(reinterpret_cast<char *>(dst), static_cast<std::streamsize>(n));
    return static_cast<size_t>(in.gcount()) == n;
}

std::optional<std::vector<uint8_t>> read_bytes(std::istream &in, size_t n) {
    std::vector<uint8_t> buf(n);
    if (!read_exact(in, buf.data(), n)) {
        return std::nullopt;
    }
    return buf;
}

std::optional<Bytes4> peek4(std::istream &in) {
    const std::streampos pos = in.tellg();
    if (pos < 0) {
        return std::nullopt;
    }
    Bytes4 b{};
    const bool ok = read_exact(in, b.data(), b.size());
    in.clear();
    in.seekg(pos);
    if (!ok) {
        return std::nullopt;
    }
    return b;
}

std::optional<uint64_t> remaining_bytes(std::istream &in) {
    const std::streampos pos = in.tellg();
    if (pos < 0) {
        return std::nullopt;
    }
    in.seekg(0, std::ios::end);
    const std::streampos end = in.tellg();
    in.clear();
    in.seekg(pos);
    if (end < pos) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(end - pos);
}

bool write_bytes(std::ostream &out, const uint8_t *data, size_t n) {
    if (n > 0) {
        out.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(n));
    }
    return out.good();
}

std::optional<uint64_t> copy_remaining(std::istream &in, std::ostream &out) {
    std::vector<char> buf(kCopyChunk);
    uint64_t total = 0;
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        // Only the bytes actually read; the final chunk is usually short.
        out.write(buf.data(), got);
        if (!out.good()) {
            return std::nullopt;
        }
        total += static_cast<uint64_t>(got);
    }
    return total;
}
