//
//  byte_order.hpp
//  TafForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace tafforge {

// ------------- Load helpers (raw buffers) -----------------------------------

inline uint16_t load_u16_le(const uint8_t *p) {
    return static_cast<uint16_t>(uint16_t(p[0]) | (uint16_t(p[1]) << 8));
}

inline uint32_t load_u32_le(const uint8_t *p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) |
           (uint32_t(p[3]) << 24);
}

inline uint64_t load_u64_le(const uint8_t *p) {
    return uint64_t(load_u32_le(p)) | (uint64_t(load_u32_le(p + 4)) << 32);
}

inline uint32_t load_u32_be(const uint8_t *p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) |
           uint32_t(p[3]);
}

// ------------- Store helpers ------------------------------------------------

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

inline void write_u32_be(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 24) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u32_le(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
}

inline void write_u64_le(std::vector<uint8_t> &p, uint64_t v) {
    write_u32_le(p, static_cast<uint32_t>(v & 0xFFFFFFFF));
    write_u32_le(p, static_cast<uint32_t>(v >> 32));
}

// ------------- Stream helpers -----------------------------------------------

// Read exactly n bytes; returns the number of bytes actually read.
inline size_t read_exact(std::istream &in, uint8_t *dst, size_t n) {
    in.read(reinterpret_cast<char *>(dst), static_cast<std::streamsize>(n));
    return static_cast<size_t>(in.gcount());
}

// Printable rendering of a 4-byte tag ("OggS"); non-printable bytes become '.'.
inline std::string tag_to_string(const uint8_t *p, size_t n = 4) {
    std::string s(n, '.');
    for (size_t i = 0; i < n; ++i) {
        if (p[i] >= 0x20 && p[i] <= 0x7E) {
            s[i] = static_cast<char>(p[i]);
        }
    }
    return s;
}

}  // namespace tafforge
