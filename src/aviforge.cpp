//
//  aviforge.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "aviforge.hpp"
#include "aviforge_version.hpp"

#include <cerrno>
#include <chrono>
#include <deque>
#include <fstream>
#include <future>
#include <utility>

#include "file_sink.hpp"
#include "jpeg_info.hpp"
#include "logging.hpp"
#include "threaded_async_sink.hpp"

namespace aviforge {

std::string version_string() { return AVIFORGE_VERSION_DISPLAY; }

namespace {

// Frames queued on the async writer before the loader waits for the oldest one.
constexpr size_t kAsyncFramesInFlight = 4;

AviStatus read_file(const std::string &path, std::vector<uint8_t> &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        std::string msg = "open failed for " + path + " " + errno_text(errno);
        AF_LOG("error", msg);
        return error_status(AviError::Io, std::move(msg));
    }
    f.seekg(0, std::ios::end);
    const std::streamoff len = f.tellg();
    f.seekg(0, std::ios::beg);
    if (len < 0) {
        std::string msg = "cannot determine size of " + path;
        AF_LOG("error", msg);
        return error_status(AviError::Io, std::move(msg));
    }
    out.resize(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(out.data()), len);
    if (f.gcount() != len) {
        std::string msg = "short read for " + path;
        AF_LOG("error", msg);
        return error_status(AviError::Io, std::move(msg));
    }
    return ok_status();
}

AviStatus load_frame(const std::string &path, size_t index, std::vector<uint8_t> &out) {
    AviStatus status = read_file(path, out);
    if (!status.ok) {
        return status;
    }
    if (!has_jpeg_soi(out)) {
        AF_LOG("warn", "frame " << index << " (" << path
                                << ") does not start with a JPEG SOI marker; hex="
                                << hex_prefix(out));
    }
    return status;
}

// Fill in a missing width/height from the first frame.
AviStatus resolve_dimensions(const std::vector<uint8_t> &first_frame, VideoParameters &params) {
    if (params.width != 0 && params.height != 0) {
        return ok_status();
    }
    auto info = probe_jpeg(first_frame);
    if (!info) {
        return error_status(AviError::InvalidConfig,
                            std::string(error_description(AviError::InvalidConfig)) +
                                ": frame size not given and first frame has no JPEG SOF header");
    }
    if (params.width == 0) {
        params.width = info->width;
    }
    if (params.height == 0) {
        params.height = info->height;
    }
    AF_LOG("info", "frame size inferred from first frame: " << params.width << "x"
                                                            << params.height);
    return ok_status();
}

AviStatus close_file(FileSink &sink, AviStatus status) {
    if (!sink.close() && status.ok) {
        std::string msg = std::string(error_description(AviError::Io)) + ": close: " +
                          sink.last_error();
        AF_LOG("error", msg);
        return error_status(AviError::Io, std::move(msg));
    }
    return status;
}

AviStatus write_sync(FileSink &file, const std::vector<std::string> &paths,
                     const VideoParameters &params, std::vector<uint8_t> first_frame) {
    AviStatus status;
    auto writer = MjpegWriter::create(file, params, status);
    if (!writer) {
        return status;
    }
    std::vector<uint8_t> frame = std::move(first_frame);
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) {
            status = load_frame(paths[i], i, frame);
            if (!status.ok) {
                return status;
            }
        }
        status = writer->add_frame(frame);
        if (!status.ok) {
            return status;
        }
    }
    return writer->finish();
}

AviStatus write_async(FileSink &file, const std::vector<std::string> &paths,
                      const VideoParameters &params, std::vector<uint8_t> first_frame) {
    ThreadedAsyncSink async_sink(file);
    AsyncMjpegWriter writer(async_sink);

    AviStatus status = writer.open(params).get();
    if (!status.ok) {
        return status;
    }

    struct InFlight {
        std::vector<uint8_t> data;
        std::future<AviStatus> done;
    };
    std::deque<InFlight> in_flight;
    auto drain_one = [&]() {
        AviStatus s = in_flight.front().done.get();
        in_flight.pop_front();
        return s;
    };

    for (size_t i = 0; i < paths.size() && status.ok; ++i) {
        InFlight item;
        if (i == 0) {
            item.data = std::move(first_frame);
        } else {
            status = load_frame(paths[i], i, item.data);
            if (!status.ok) {
                break;
            }
        }
        // Moving the vector keeps its heap buffer, so the span stays valid.
        item.done = writer.add_frame(ByteSpan(item.data));
        in_flight.push_back(std::move(item));
        if (in_flight.size() >= kAsyncFramesInFlight) {
            status = drain_one();
        }
    }
    // Buffers must outlive their operations, failed or not.
    while (!in_flight.empty()) {
        AviStatus s = drain_one();
        if (status.ok && !s.ok) {
            status = s;
        }
    }
    if (!status.ok) {
        return status;
    }
    return writer.finish().get();
}

}  // namespace

AviStatus write_avi_from_jpegs(const std::vector<std::string> &jpeg_paths,
                               const VideoParameters &params, const std::string &output_path,
                               bool use_async) {
    const auto t0 = std::chrono::steady_clock::now();
    AF_LOG("debug", "write_avi_from_jpegs frames=" << jpeg_paths.size() << " output="
                                                   << output_path << " async=" << use_async);
    if (output_path.empty()) {
        return error_status(AviError::InvalidConfig,
                            std::string(error_description(AviError::InvalidConfig)) +
                                ": no output path");
    }

    VideoParameters resolved = params;
    std::vector<uint8_t> first_frame;
    if (!jpeg_paths.empty()) {
        AviStatus status = load_frame(jpeg_paths.front(), 0, first_frame);
        if (!status.ok) {
            return status;
        }
        status = resolve_dimensions(first_frame, resolved);
        if (!status.ok) {
            AF_LOG("error", status.message);
            return status;
        }
    }

    FileSink file(output_path);
    if (!file.is_open()) {
        std::string msg = std::string(error_description(AviError::Io)) + ": " + file.last_error();
        AF_LOG("error", msg);
        return error_status(AviError::Io, std::move(msg));
    }

    AviStatus status = use_async
                           ? write_async(file, jpeg_paths, resolved, std::move(first_frame))
                           : write_sync(file, jpeg_paths, resolved, std::move(first_frame));
    status = close_file(file, std::move(status));
    if (!status.ok) {
        AF_LOG("error", "failed to write " << output_path << ": " << status.message);
        return status;
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    AF_LOG("info", "wrote " << jpeg_paths.size() << " frames to " << output_path << " in " << ms
                            << " ms");
    return status;
}

AviStatus run_job(const JobConfig &job) {
    if (job.output.empty()) {
        return error_status(AviError::InvalidConfig,
                            std::string(error_description(AviError::InvalidConfig)) +
                                ": job has no output path");
    }
    return write_avi_from_jpegs(job.frames, job.params, job.output, job.use_async);
}

AviStatus write_avi_from_job(const std::string &job_path, const std::string &output_override) {
    JobConfig job;
    AviStatus status = load_job(job_path, job);
    if (!status.ok) {
        return status;
    }
    if (!output_override.empty()) {
        job.output = output_override;
    }
    return run_job(job);
}

}  // namespace aviforge
