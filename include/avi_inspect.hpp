//
//  avi_inspect.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "avi_status.hpp"

namespace aviforge {

struct AviIndexEntry {
    uint32_t tag = 0;
    uint32_t flags = 0;
    uint32_t offset = 0;  // relative to the 'movi' tag
    uint32_t size = 0;
};

/// @ingroup api
/// What a finalized single-stream MJPEG AVI declares about itself.
struct AviSummary {
    uint64_t file_size = 0;
    uint32_t riff_size = 0;
    uint32_t micro_sec_per_frame = 0;
    uint32_t avih_total_frames = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t stream_type = 0;  // 'vids'
    uint32_t handler = 0;      // 'MJPG'
    uint32_t fps = 0;
    uint32_t stream_length = 0;
    uint32_t compression = 0;  // strf biCompression
    uint32_t bitmap_size_image = 0;
    uint32_t odml_total_frames = 0;
    uint64_t movi_offset = 0;  // absolute offset of the 'movi' tag
    uint32_t movi_size = 0;
    std::vector<AviIndexEntry> index;
    bool index_consistent = false;  // every entry names a matching "00dc" chunk inside movi
};

// Decode a complete container held in memory. Fails with MalformedContainer.
AviStatus parse_avi(std::span<const uint8_t> data, AviSummary &out);

// Load path and parse it. Fails with Io when the file cannot be read.
AviStatus read_avi(const std::string &path, AviSummary &out);

}  // namespace aviforge
