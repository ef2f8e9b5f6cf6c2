//
//  byte_stream.hpp
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

#include "int_codec.hpp"

// Sequential byte source/sink helpers over iostreams.

// Read exactly `n` bytes; false on a short read.
bool read_exact(std::istream &in, uint8_t *dst, size_t n);

std::optional<std::vector<uint8_t>> read_bytes(std::istream &in, size_t n);

// Look at the next four bytes without consuming them. nullopt when fewer remain.
std::optional<Bytes4> peek4(std::istream &in);

// Bytes left between the read position and EOF; nullopt for unseekable streams.
std::optional<uint64_t> remaining_bytes(std::istream &in);

bool write_bytes(std::ostream &out, const uint8_t *data, size_t n);

inline bool write_bytes(std::ostream &out, const std::vector<uint8_t> &data) {
    return write_bytes(out, data.data(), data.size());
}

// Copy everything from the current read position to EOF. Returns bytes copied,
// nullopt if a write failed.
std::optional<uint64_t> copy_remaining(std::istream &in, std::ostream &out);
