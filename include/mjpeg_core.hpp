//
//  mjpeg_core.hpp
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
#include "byte_sink.hpp"
#include "logging.hpp"
#include "riff_chunks.hpp"
#include "sink_program.hpp"
#include "size_accountant.hpp"
#include "video_parameters.hpp"

namespace aviforge {

enum class WriterPhase { Idle, Open, Finalized };

const char *phase_name(WriterPhase phase);

// Writer state machine and planner shared by the synchronous and asynchronous writers.
// plan_* validate and describe the sink operations without touching any sink; commit_*
// record the outcome once the program ran. A rejected plan leaves the state unchanged.
class MjpegAviCore {
   public:
    AviStatus plan_open(const VideoParameters &params, SinkProgram &program) const;
    void commit_open(const VideoParameters &params);

    // fragments are concatenated into one logical frame.
    AviStatus plan_frame(const std::vector<ByteSpan> &fragments, SinkProgram &program,
                         FrameAdmission &admission) const;
    void commit_frame(const FrameAdmission &admission);

    AviStatus plan_finish(SinkProgram &program, FinalSizes &sizes) const;

    // Terminal state; entered once finish (or a failed open) started writing.
    void mark_finalized() { phase_ = WriterPhase::Finalized; }

    WriterPhase phase() const { return phase_; }
    const VideoParameters &params() const { return params_; }
    size_t frame_count() const { return frame_sizes_.size(); }
    const std::vector<uint32_t> &frame_sizes() const { return frame_sizes_; }
    uint64_t jpeg_total_size() const { return jpeg_total_size_; }
    uint64_t estimated_file_size() const { return estimated_file_size_; }

   private:
    AviStatus check_phase_open(const char *operation) const;

    WriterPhase phase_ = WriterPhase::Idle;
    VideoParameters params_{};
    std::vector<uint32_t> frame_sizes_;  // padded (even) sizes in arrival order
    uint64_t jpeg_total_size_ = 0;       // sum of frame_sizes_
    uint64_t estimated_file_size_ = kAviHeaderSize;
};

// -----------------------------------------------------------------------------
// Plan, run and commit one operation. Sink is ByteSink (blocking) or AsyncByteSink
// (each operation awaited in order); run_sink_program() picks the strategy.
// -----------------------------------------------------------------------------
template <typename Sink>
AviStatus open_avi(MjpegAviCore &core, Sink &sink, const VideoParameters &params) {
    SinkProgram program;
    AviStatus status = core.plan_open(params, program);
    if (!status.ok) {
        AF_LOG("warn", "open rejected: " << status.message);
        return status;
    }
    status = run_sink_program(sink, program);
    if (!status.ok) {
        core.mark_finalized();
        return status;
    }
    core.commit_open(params);
    AF_LOG("debug", "opened MJPEG AVI " << params.width << "x" << params.height << " @ "
                                        << params.fps << " fps");
    return status;
}

template <typename Sink>
AviStatus append_frame(MjpegAviCore &core, Sink &sink, const std::vector<ByteSpan> &fragments) {
    SinkProgram program;
    FrameAdmission admission;
    AviStatus status = core.plan_frame(fragments, program, admission);
    if (!status.ok) {
        AF_LOG("warn", "frame " << core.frame_count() << " rejected: " << status.message);
        return status;
    }
    status = run_sink_program(sink, program);
    if (!status.ok) {
        return status;
    }
    uint64_t raw_size = 0;
    for (const auto &f : fragments) {
        raw_size += f.size();
    }
    AF_LOG("debug", "frame " << core.frame_count() << " fragments=" << fragments.size()
                             << " raw=" << raw_size << " padded=" << admission.padded_size
                             << " hex="
                             << (fragments.empty() ? std::string("<none>")
                                                   : hex_prefix(fragments.front())));
    core.commit_frame(admission);
    return status;
}

template <typename Sink>
AviStatus finish_avi(MjpegAviCore &core, Sink &sink) {
    SinkProgram program;
    FinalSizes sizes;
    AviStatus status = core.plan_finish(program, sizes);
    if (!status.ok) {
        AF_LOG("warn", "finish rejected: " << status.message);
        return status;
    }
    core.mark_finalized();
    status = run_sink_program(sink, program);
    if (!status.ok) {
        return status;
    }
    AF_LOG("debug", "finished frames=" << core.frame_count() << " riff_size="
                                       << sizes.total_file_size << " movi_size="
                                       << sizes.movi_size << " idx1_size=" << sizes.index_size);
    return status;
}

}  // namespace aviforge
