//
//  riff_chunks.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <array>
#include <cstdint>
#include <vector>

#include "fourcc_utils.hpp"

namespace aviforge {

// Structural constants of the single-stream MJPEG layout.
inline constexpr uint32_t kAviHeaderSize = 256;
inline constexpr uint32_t kChunkHeaderSize = 8;   // fourcc + size
inline constexpr uint32_t kIndexEntrySize = 16;   // fourcc + flags + offset + size
inline constexpr uint32_t kMoviListTagSize = 4;   // 'movi' counted by the movi LIST size
inline constexpr uint32_t kIndexKeyFrameFlag = 0x10;  // AVIIF_KEYFRAME

inline constexpr uint32_t kFrameChunkTag = fourcc('0', '0', 'd', 'c');  // stream 0, compressed
inline constexpr uint32_t kIndexChunkTag = fourcc('i', 'd', 'x', '1');

// ------------- Helper write functions (little-endian) -----------------------

inline void write_u16le(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
}

inline void write_u32le(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
}

inline void write_fourcc(std::vector<uint8_t> &p, const char t[4]) {
    p.push_back(static_cast<uint8_t>(t[0]));
    p.push_back(static_cast<uint8_t>(t[1]));
    p.push_back(static_cast<uint8_t>(t[2]));
    p.push_back(static_cast<uint8_t>(t[3]));
}

inline void write_fourcc(std::vector<uint8_t> &p, uint32_t tag) { write_u32le(p, tag); }

inline std::array<uint8_t, 4> u32le_bytes(uint32_t v) {
    return {static_cast<uint8_t>(v & 0xFF), static_cast<uint8_t>((v >> 8) & 0xFF),
            static_cast<uint8_t>((v >> 16) & 0xFF), static_cast<uint8_t>((v >> 24) & 0xFF)};
}

inline uint32_t read_u32le(const uint8_t *p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) |
           (uint32_t(p[3]) << 24);
}

// 8-byte frame chunk header: "00dc" + padded payload size.
inline void write_frame_chunk_header(std::vector<uint8_t> &p, uint32_t padded_size) {
    write_fourcc(p, kFrameChunkTag);
    write_u32le(p, padded_size);
}

// 8-byte idx1 chunk header: "idx1" + index size.
inline void write_index_header(std::vector<uint8_t> &p, uint32_t index_size) {
    write_fourcc(p, kIndexChunkTag);
    write_u32le(p, index_size);
}

// 16-byte idx1 entry; every MJPEG frame is a key frame.
inline void write_index_entry(std::vector<uint8_t> &p, uint32_t offset, uint32_t size) {
    write_fourcc(p, kFrameChunkTag);
    write_u32le(p, kIndexKeyFrameFlag);
    write_u32le(p, offset);
    write_u32le(p, size);
}

}  // namespace aviforge
