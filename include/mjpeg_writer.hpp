//
//  mjpeg_writer.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

#include "avi_status.hpp"
#include "byte_sink.hpp"
#include "mjpeg_core.hpp"
#include "video_parameters.hpp"

namespace aviforge {

/// @defgroup api AviForge Public API
/// Public, supported C++ interfaces for streaming JPEG frames into an MJPEG AVI.
/// @{

/// Minimal frame-writer contract shared by synchronous writers.
class MjpegAviWriter {
   public:
    virtual ~MjpegAviWriter() = default;

    virtual AviStatus add_frame(ByteSpan jpeg) = 0;
    virtual AviStatus finish() = 0;
};

/**
 * @brief Streams frames into a ByteSink; never buffers the payload.
 *
 * Lifecycle: open() once, add_frame()/add_frame_vectored() any number of times, finish()
 * exactly once. Calls out of that order fail with NotStarted or AlreadyFinalized. The sink
 * must outlive the writer. Not thread-safe.
 */
class MjpegWriter : public MjpegAviWriter {
   public:
    explicit MjpegWriter(ByteSink &sink);
    ~MjpegWriter() override;

    MjpegWriter(const MjpegWriter &) = delete;
    MjpegWriter &operator=(const MjpegWriter &) = delete;

    /// Open a writer and emit the 256-byte header. Returns nullptr with `status` set on error
    /// (InvalidFrameSize when fps == 0, Io when the header cannot be written).
    static std::unique_ptr<MjpegWriter> create(ByteSink &sink, const VideoParameters &params,
                                               AviStatus &status);

    /// Write the header; must precede every other call.
    AviStatus open(const VideoParameters &params);

    AviStatus add_frame(ByteSpan jpeg) override;

    /// Append one frame given as fragments; issued as a single scatter/gather write.
    AviStatus add_frame_vectored(const std::vector<ByteSpan> &fragments);

    /// Write idx1 and patch the header totals. The file is only valid after this succeeds.
    AviStatus finish() override;

    WriterPhase phase() const { return core_.phase(); }
    size_t frame_count() const { return core_.frame_count(); }
    const std::vector<uint32_t> &frame_sizes() const { return core_.frame_sizes(); }
    uint64_t jpeg_total_size() const { return core_.jpeg_total_size(); }
    uint64_t estimated_file_size() const { return core_.estimated_file_size(); }

   private:
    ByteSink &sink_;
    MjpegAviCore core_;
};

/**
 * @brief Asynchronous writer over an AsyncByteSink.
 *
 * Every call returns immediately with a future; operations run strictly in call order, each
 * starting only after the previous one completed, so a later frame's bytes never reach the
 * sink before an earlier one's. Frame buffers must stay alive until the returned future is
 * ready. The destructor waits for outstanding operations.
 */
class AsyncMjpegWriter {
   public:
    explicit AsyncMjpegWriter(AsyncByteSink &sink);
    ~AsyncMjpegWriter();

    AsyncMjpegWriter(const AsyncMjpegWriter &) = delete;
    AsyncMjpegWriter &operator=(const AsyncMjpegWriter &) = delete;

    std::future<AviStatus> open(const VideoParameters &params);
    std::future<AviStatus> add_frame(ByteSpan jpeg);
    std::future<AviStatus> add_frame_vectored(std::vector<ByteSpan> fragments);
    std::future<AviStatus> finish();

    // Observers block while an operation is running.
    WriterPhase phase() const;
    size_t frame_count() const;
    uint64_t jpeg_total_size() const;

   private:
    std::future<AviStatus> enqueue(std::function<AviStatus()> step);

    AsyncByteSink &sink_;

    mutable std::mutex core_mutex_;  // held for the whole of each operation
    MjpegAviCore core_;

    std::mutex chain_mutex_;
    std::shared_future<void> tail_;  // completes when the last enqueued operation is done
};

/// @}

}  // namespace aviforge
