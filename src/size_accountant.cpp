//
//  size_accountant.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "size_accountant.hpp"

#include <limits>
#include <string>

#include "riff_chunks.hpp"

namespace aviforge {

namespace {

constexpr uint64_t kU32Max = std::numeric_limits<uint32_t>::max();

bool checked_add(uint64_t a, uint64_t b, uint64_t &out) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        return false;
    }
    out = a + b;
    return true;
}

bool checked_mul(uint64_t a, uint64_t b, uint64_t &out) {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
        return false;
    }
    out = a * b;
    return true;
}

AviStatus overflow(const char *what) {
    return error_status(AviError::FileSizeExceeded,
                        std::string(error_description(AviError::FileSizeExceeded)) + ": " + what);
}

}  // namespace

AviStatus check_frame_admission(size_t frame_count, uint64_t estimated_file_size,
                                uint64_t frame_length, FrameAdmission &out) {
    if (frame_count >= kMaxFrameCount) {
        return error_status(AviError::FrameCountExceeded,
                            "Frame count limit exceeded (" + std::to_string(kMaxFrameCount) + ")");
    }
    if (frame_length > kU32Max) {
        return error_status(AviError::FrameSizeExceeded,
                            "Frame size " + std::to_string(frame_length) + " exceeds u32 limit");
    }

    const uint64_t padded = padded_frame_length(frame_length);
    uint64_t projected = 0;
    if (!checked_add(estimated_file_size, kChunkHeaderSize + padded + kIndexEntrySize,
                     projected) ||
        projected > kMaxAviFileSize) {
        return overflow("projected file size");
    }

    // padded <= 2^32 here but the projection bound above keeps it below 2^31.
    out.padded_size = static_cast<uint32_t>(padded);
    out.next_estimate = projected;
    return ok_status();
}

AviStatus compute_final_sizes(const std::vector<uint32_t> &frame_sizes, uint64_t jpeg_total_size,
                              FinalSizes &out) {
    const uint64_t frame_count = frame_sizes.size();
    if (frame_count > kU32Max) {
        return error_status(AviError::FrameCountExceeded,
                            error_description(AviError::FrameCountExceeded));
    }

    uint64_t index_size = 0;
    if (!checked_mul(frame_count, kIndexEntrySize, index_size) || index_size > kU32Max) {
        return overflow("index size");
    }

    // Per frame: chunk header in movi plus one idx1 entry.
    uint64_t per_frame = 0;
    uint64_t total = 0;
    if (!checked_mul(frame_count, kChunkHeaderSize + kIndexEntrySize, per_frame) ||
        !checked_add(kAviHeaderSize, jpeg_total_size, total) ||
        !checked_add(total, per_frame, total) || total > kU32Max) {
        return overflow("total file size");
    }

    uint64_t chunk_headers = 0;
    uint64_t movi = 0;
    if (!checked_mul(frame_count, kChunkHeaderSize, chunk_headers) ||
        !checked_add(kMoviListTagSize, jpeg_total_size, movi) ||
        !checked_add(movi, chunk_headers, movi) || movi > kU32Max) {
        return overflow("movi size");
    }

    out.total_file_size = static_cast<uint32_t>(total);
    out.movi_size = static_cast<uint32_t>(movi);
    out.index_size = static_cast<uint32_t>(index_size);
    return ok_status();
}

AviStatus compute_index_offsets(const std::vector<uint32_t> &frame_sizes,
                                std::vector<uint32_t> &offsets) {
    offsets.clear();
    offsets.reserve(frame_sizes.size());
    uint64_t offset = kMoviListTagSize;
    for (uint32_t size : frame_sizes) {
        if (offset > kU32Max) {
            return overflow("index offset");
        }
        offsets.push_back(static_cast<uint32_t>(offset));
        offset += kChunkHeaderSize + static_cast<uint64_t>(size);
    }
    return ok_status();
}

}  // namespace aviforge
