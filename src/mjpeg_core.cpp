//
//  mjpeg_core.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "mjpeg_core.hpp"

#include <string>
#include <utility>

#include "avi_header_builder.hpp"
#include "riff_chunks.hpp"

namespace aviforge {

const char *phase_name(WriterPhase phase) {
    switch (phase) {
        case WriterPhase::Idle:
            return "idle";
        case WriterPhase::Open:
            return "open";
        case WriterPhase::Finalized:
            return "finalized";
    }
    return "unknown";
}

AviStatus MjpegAviCore::check_phase_open(const char *operation) const {
    if (phase_ == WriterPhase::Idle) {
        return error_status(AviError::NotStarted,
                            std::string(operation) + ": " + error_description(AviError::NotStarted));
    }
    if (phase_ == WriterPhase::Finalized) {
        return error_status(AviError::AlreadyFinalized, std::string(operation) + ": " +
                                                            error_description(AviError::AlreadyFinalized));
    }
    return ok_status();
}

// -----------------------------------------------------------------------------
// Header.
// -----------------------------------------------------------------------------
AviStatus MjpegAviCore::plan_open(const VideoParameters &params, SinkProgram &program) const {
    if (phase_ != WriterPhase::Idle) {
        return error_status(AviError::AlreadyFinalized,
                            std::string("open: ") + error_description(AviError::AlreadyFinalized));
    }
    if (params.fps == 0) {
        return error_status(AviError::InvalidFrameSize,
                            std::string(error_description(AviError::InvalidFrameSize)) +
                                ": fps must be non-zero");
    }
    auto header = program.stage(build_avi_header(params));
    program.write("avi header", {header});
    return ok_status();
}

void MjpegAviCore::commit_open(const VideoParameters &params) {
    params_ = params;
    phase_ = WriterPhase::Open;
}

// -----------------------------------------------------------------------------
// Frame chunk: "00dc" + padded size, payload fragments, optional zero pad byte.
// -----------------------------------------------------------------------------
AviStatus MjpegAviCore::plan_frame(const std::vector<ByteSpan> &fragments, SinkProgram &program,
                                   FrameAdmission &admission) const {
    AviStatus status = check_phase_open("add_frame");
    if (!status.ok) {
        return status;
    }

    uint64_t length = 0;
    for (const auto &f : fragments) {
        length += f.size();
    }
    if (length == 0) {
        return error_status(AviError::InvalidFrameSize,
                            std::string(error_description(AviError::InvalidFrameSize)) +
                                ": frame is empty");
    }

    status = check_frame_admission(frame_sizes_.size(), estimated_file_size_, length, admission);
    if (!status.ok) {
        return status;
    }

    std::vector<uint8_t> chunk_header;
    chunk_header.reserve(kChunkHeaderSize);
    write_frame_chunk_header(chunk_header, admission.padded_size);

    std::vector<ByteSpan> buffers;
    buffers.reserve(fragments.size() + 2);
    buffers.push_back(program.stage(std::move(chunk_header)));
    for (const auto &f : fragments) {
        if (!f.empty()) {
            buffers.push_back(f);
        }
    }
    if (admission.padded_size != length) {
        buffers.push_back(program.stage({0x00}));
    }
    program.write("frame " + std::to_string(frame_sizes_.size()) + " chunk", std::move(buffers));
    return ok_status();
}

void MjpegAviCore::commit_frame(const FrameAdmission &admission) {
    frame_sizes_.push_back(admission.padded_size);
    jpeg_total_size_ += admission.padded_size;
    estimated_file_size_ = admission.next_estimate;
}

// -----------------------------------------------------------------------------
// idx1 table, then patch the header placeholders.
// -----------------------------------------------------------------------------
AviStatus MjpegAviCore::plan_finish(SinkProgram &program, FinalSizes &sizes) const {
    AviStatus status = check_phase_open("finish");
    if (!status.ok) {
        return status;
    }
    status = compute_final_sizes(frame_sizes_, jpeg_total_size_, sizes);
    if (!status.ok) {
        return status;
    }
    std::vector<uint32_t> offsets;
    status = compute_index_offsets(frame_sizes_, offsets);
    if (!status.ok) {
        return status;
    }

    std::vector<uint8_t> index;
    index.reserve(kChunkHeaderSize + static_cast<size_t>(sizes.index_size));
    write_index_header(index, sizes.index_size);
    for (size_t i = 0; i < frame_sizes_.size(); ++i) {
        write_index_entry(index, offsets[i], frame_sizes_[i]);
    }
    program.write("idx1 table", {program.stage(std::move(index))});

    const uint32_t frames = static_cast<uint32_t>(frame_sizes_.size());
    const struct {
        const char *name;
        uint64_t offset;
        uint32_t value;
    } patches[] = {
        {"riff size", kRiffSizeOffset, sizes.total_file_size},
        {"avih total frames", kAvihTotalFramesOffset, frames},
        {"strh length", kStrhLengthOffset, frames},
        {"dmlh total frames", kOdmlTotalFramesOffset, frames},
        {"movi size", kMoviSizeOffset, sizes.movi_size},
    };
    for (const auto &patch : patches) {
        const std::string label =
            std::string("patch ") + patch.name + " @" + std::to_string(patch.offset);
        const auto bytes = u32le_bytes(patch.value);
        program.seek(label, patch.offset);
        program.write(label, {program.stage(std::vector<uint8_t>(bytes.begin(), bytes.end()))});
    }
    return ok_status();
}

}  // namespace aviforge
