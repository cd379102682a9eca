//
//  byte_io.hpp
//  TafForge
//
//  Created by Till Toenshoff on 2/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// ------------- Big-endian (TAF length prefix) ---------------------------------

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

inline void write_u32_be(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 24) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline uint32_t read_u32_be(const uint8_t *b) {
    return (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) |
           (uint32_t(b[3]));
}

// ------------- Little-endian (Ogg page header) --------------------------------

inline void write_u16_le(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
}

inline void write_u32_le(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
}

inline void write_u64_le(std::vector<uint8_t> &p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

inline uint16_t read_u16_le(const uint8_t *b) { return uint16_t(b[0]) | (uint16_t(b[1]) << 8); }

inline uint32_t read_u32_le(const uint8_t *b) {
    return uint32_t(b[0]) | (uint32_t(b[1]) << 8) | (uint32_t(b[2]) << 16) |
           (uint32_t(b[3]) << 24);
}

inline uint64_t read_u64_le(const uint8_t *b) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | b[i];
    }
    return v;
}
