//
//  avi_header_builder.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <vector>

#include "riff_chunks.hpp"
#include "video_parameters.hpp"

namespace aviforge {

// Absolute offsets inside the 256-byte header.
inline constexpr uint64_t kRiffSizeOffset = 4;
inline constexpr uint64_t kMicroSecPerFrameOffset = 32;
inline constexpr uint64_t kAvihTotalFramesOffset = 48;
inline constexpr uint64_t kAvihWidthOffset = 64;
inline constexpr uint64_t kAvihHeightOffset = 68;
inline constexpr uint64_t kStrhRateOffset = 128;
inline constexpr uint64_t kStrhLengthOffset = 140;
inline constexpr uint64_t kStrhFrameWidthOffset = 164;
inline constexpr uint64_t kStrhFrameHeightOffset = 168;
inline constexpr uint64_t kBitmapWidthOffset = 184;
inline constexpr uint64_t kBitmapHeightOffset = 188;
inline constexpr uint64_t kBitmapSizeImageOffset = 200;
inline constexpr uint64_t kOdmlTotalFramesOffset = 240;
inline constexpr uint64_t kMoviSizeOffset = 248;

// Nominal 24-bit DIB size: row stride padded to 4 bytes, times height (32-bit wrap).
uint32_t bitmap_image_size(uint32_t width, uint32_t height);

// Build the fixed RIFF/AVI header (hdrl + strl + odml + movi LIST head). File size, frame
// totals and the movi size are zero placeholders patched at finish. Requires fps > 0.
std::vector<uint8_t> build_avi_header(const VideoParameters &params);

}  // namespace aviforge
