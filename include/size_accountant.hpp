//
//  size_accountant.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "avi_status.hpp"

namespace aviforge {

inline constexpr uint64_t kMaxAviFileSize = 2147483648ULL - 1;  // RIFF 2 GB limit
inline constexpr uint32_t kMaxFrameCount = 1000000;

// Totals patched into the header at finish; each is range-checked against its 32-bit field.
struct FinalSizes {
    uint32_t total_file_size = 0;  // RIFF size field (file length - 8)
    uint32_t movi_size = 0;        // movi LIST size field ('movi' + chunks, no idx1)
    uint32_t index_size = 0;       // idx1 payload size
};

// Admission result for one candidate frame.
struct FrameAdmission {
    uint32_t padded_size = 0;     // frame length rounded up to even
    uint64_t next_estimate = 0;   // estimated file size once the frame is written
};

// Even-padded chunk payload length.
inline constexpr uint64_t padded_frame_length(uint64_t length) {
    return (length % 2 == 1) ? length + 1 : length;
}

// Early, pessimistic per-frame check performed before any byte is written. Rejects with
// FrameCountExceeded, FrameSizeExceeded or FileSizeExceeded; does not check for empty frames.
AviStatus check_frame_admission(size_t frame_count, uint64_t estimated_file_size,
                                uint64_t frame_length, FrameAdmission &out);

// Authoritative totals from the complete frame list. Any overflow is FileSizeExceeded.
AviStatus compute_final_sizes(const std::vector<uint32_t> &frame_sizes, uint64_t jpeg_total_size,
                              FinalSizes &out);

// idx1 offset of every frame chunk, relative to the 'movi' tag (first frame at 4).
AviStatus compute_index_offsets(const std::vector<uint32_t> &frame_sizes,
                                std::vector<uint32_t> &offsets);

}  // namespace aviforge
