//
//  jpeg_info.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#pragma once

#include <cstdint>
#include <optional>
#include <span>

namespace aviforge {

struct JpegInfo {
    uint16_t width = 0;
    uint16_t height = 0;
    uint8_t components = 0;
    bool is_yuv420 = false;    // 3 components sampled 2x2,1x1,1x1
    bool progressive = false;  // SOF2/6/10/14
};

// True when the buffer starts with the JPEG SOI marker (FF D8).
bool has_jpeg_soi(std::span<const uint8_t> data);

// Minimal JPEG header inspection: walks marker segments up to the first SOF and reports
// dimensions and sampling. Returns nullopt for non-JPEG data or when no SOF precedes SOS/EOI.
std::optional<JpegInfo> probe_jpeg(std::span<const uint8_t> data);

}  // namespace aviforge
