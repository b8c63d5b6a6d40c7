//
//  file_sink.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "byte_sink.hpp"

namespace aviforge {

/// @ingroup api
/// std::ofstream-backed sink. The file is created (truncated) on construction.
class FileSink : public ByteSink {
   public:
    explicit FileSink(const std::string &path);

    bool is_open() const { return out_.is_open(); }
    bool write(ByteSpan data) override;
    bool seek(uint64_t offset) override;
    std::string last_error() const override { return error_; }

    // Flush and close; false when buffered data could not be written.
    bool close();

   private:
    std::string path_;
    std::ofstream out_;
    std::string error_;
};

/// @ingroup api
/// POSIX descriptor sink. write_vectored() issues writev(2) so a frame's chunk header,
/// payload fragments and padding reach the kernel in one call.
class FdSink : public ByteSink {
   public:
    // Adopt an already-open descriptor; closed on destruction when owns_fd is true.
    FdSink(int fd, bool owns_fd);
    ~FdSink() override;

    FdSink(const FdSink &) = delete;
    FdSink &operator=(const FdSink &) = delete;

    // Create/truncate path for writing. Returns nullptr (and logs) on failure.
    static std::unique_ptr<FdSink> create(const std::string &path);

    bool write(ByteSpan data) override;
    bool write_vectored(const std::vector<ByteSpan> &buffers) override;
    bool seek(uint64_t offset) override;
    std::string last_error() const override { return error_; }

    bool sync();
    bool close();
    int fd() const { return fd_; }

   private:
    bool fail(const char *what, int err);

    int fd_ = -1;
    bool owns_fd_ = false;
    std::string error_;
};

}  // namespace aviforge
