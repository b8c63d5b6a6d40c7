//
//  mjpeg_writer.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "mjpeg_writer.hpp"

#include <exception>
#include <string>
#include <utility>

#include "logging.hpp"

namespace aviforge {

// -----------------------------------------------------------------------------
// Synchronous writer.
// -----------------------------------------------------------------------------
MjpegWriter::MjpegWriter(ByteSink &sink) : sink_(sink) {}

MjpegWriter::~MjpegWriter() {
    if (core_.phase() == WriterPhase::Open && core_.frame_count() > 0) {
        AF_LOG("warn", "MjpegWriter destroyed with " << core_.frame_count()
                                                     << " frames but finish() was never called; "
                                                        "the AVI is not valid");
    }
}

std::unique_ptr<MjpegWriter> MjpegWriter::create(ByteSink &sink, const VideoParameters &params,
                                                 AviStatus &status) {
    auto writer = std::make_unique<MjpegWriter>(sink);
    status = writer->open(params);
    if (!status.ok) {
        return nullptr;
    }
    return writer;
}

AviStatus MjpegWriter::open(const VideoParameters &params) { return open_avi(core_, sink_, params); }

AviStatus MjpegWriter::add_frame(ByteSpan jpeg) {
    return append_frame(core_, sink_, std::vector<ByteSpan>{jpeg});
}

AviStatus MjpegWriter::add_frame_vectored(const std::vector<ByteSpan> &fragments) {
    return append_frame(core_, sink_, fragments);
}

AviStatus MjpegWriter::finish() { return finish_avi(core_, sink_); }

// -----------------------------------------------------------------------------
// Asynchronous writer.
// -----------------------------------------------------------------------------
AsyncMjpegWriter::AsyncMjpegWriter(AsyncByteSink &sink) : sink_(sink) {}

AsyncMjpegWriter::~AsyncMjpegWriter() {
    std::shared_future<void> tail;
    {
        std::lock_guard<std::mutex> lock(chain_mutex_);
        tail = tail_;
    }
    if (tail.valid()) {
        tail.wait();
    }
    std::lock_guard<std::mutex> lock(core_mutex_);
    if (core_.phase() == WriterPhase::Open && core_.frame_count() > 0) {
        AF_LOG("warn", "AsyncMjpegWriter destroyed with " << core_.frame_count()
                                                          << " frames but finish() was never "
                                                             "called; the AVI is not valid");
    }
}

std::future<AviStatus> AsyncMjpegWriter::enqueue(std::function<AviStatus()> step) {
    std::lock_guard<std::mutex> lock(chain_mutex_);
    std::shared_future<void> previous = tail_;
    auto done = std::make_shared<std::promise<void>>();
    tail_ = done->get_future().share();

    return std::async(std::launch::async, [previous, done, step = std::move(step)]() {
        if (previous.valid()) {
            previous.wait();
        }
        AviStatus status;
        try {
            status = step();
        } catch (const std::exception &e) {
            AF_LOG("error", "async writer operation failed: " << e.what());
            status = error_status(AviError::Io, e.what());
        } catch (...) {
            AF_LOG("error", "async writer operation failed with a non-standard exception");
            status = error_status(AviError::Io, std::string(error_description(AviError::Io)) +
                                                    ": unknown exception");
        }
        done->set_value();
        return status;
    });
}

std::future<AviStatus> AsyncMjpegWriter::open(const VideoParameters &params) {
    return enqueue([this, params] {
        std::lock_guard<std::mutex> lock(core_mutex_);
        return open_avi(core_, sink_, params);
    });
}

std::future<AviStatus> AsyncMjpegWriter::add_frame(ByteSpan jpeg) {
    return add_frame_vectored(std::vector<ByteSpan>{jpeg});
}

std::future<AviStatus> AsyncMjpegWriter::add_frame_vectored(std::vector<ByteSpan> fragments) {
    return enqueue([this, fragments = std::move(fragments)] {
        std::lock_guard<std::mutex> lock(core_mutex_);
        return append_frame(core_, sink_, fragments);
    });
}

std::future<AviStatus> AsyncMjpegWriter::finish() {
    return enqueue([this] {
        std::lock_guard<std::mutex> lock(core_mutex_);
        return finish_avi(core_, sink_);
    });
}

WriterPhase AsyncMjpegWriter::phase() const {
    std::lock_guard<std::mutex> lock(core_mutex_);
    return core_.phase();
}

size_t AsyncMjpegWriter::frame_count() const {
    std::lock_guard<std::mutex> lock(core_mutex_);
    return core_.frame_count();
}

uint64_t AsyncMjpegWriter::jpeg_total_size() const {
    std::lock_guard<std::mutex> lock(core_mutex_);
    return core_.jpeg_total_size();
}

}  // namespace aviforge
