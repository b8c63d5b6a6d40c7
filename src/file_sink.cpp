//
//  file_sink.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "file_sink.hpp"

#include <algorithm>
#include <cerrno>

#include <fcntl.h>
#include <limits.h>
#include <sys/uio.h>
#include <unistd.h>

#include "logging.hpp"

namespace aviforge {

// -----------------------------------------------------------------------------
// FileSink.
// -----------------------------------------------------------------------------
FileSink::FileSink(const std::string &path)
    : path_(path), out_(path, std::ios::binary | std::ios::trunc) {
    if (!out_.is_open()) {
        error_ = "open failed for " + path + " " + errno_text(errno);
        AF_LOG("error", error_);
    }
}

bool FileSink::write(ByteSpan data) {
    if (!out_.is_open()) {
        error_ = "write on closed file " + path_;
        return false;
    }
    out_.write(reinterpret_cast<const char *>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!out_.good()) {
        error_ = "write failed for " + path_ + " " + errno_text(errno);
        return false;
    }
    return true;
}

bool FileSink::seek(uint64_t offset) {
    if (!out_.is_open()) {
        error_ = "seek on closed file " + path_;
        return false;
    }
    out_.seekp(static_cast<std::streamoff>(offset));
    if (!out_.good()) {
        error_ = "seek to " + std::to_string(offset) + " failed for " + path_;
        return false;
    }
    return true;
}

bool FileSink::close() {
    if (!out_.is_open()) {
        return true;
    }
    out_.flush();
    const bool ok = out_.good();
    out_.close();
    if (!ok) {
        error_ = "flush failed for " + path_ + " " + errno_text(errno);
    }
    return ok;
}

// -----------------------------------------------------------------------------
// FdSink.
// -----------------------------------------------------------------------------
FdSink::FdSink(int fd, bool owns_fd) : fd_(fd), owns_fd_(owns_fd) {}

FdSink::~FdSink() {
    if (!close()) {
        AF_LOG("warn", "FdSink: " << error_);
    }
}

std::unique_ptr<FdSink> FdSink::create(const std::string &path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        AF_LOG("error", "open failed for " << path << " " << errno_text(errno));
        return nullptr;
    }
    return std::make_unique<FdSink>(fd, true);
}

bool FdSink::fail(const char *what, int err) {
    error_ = std::string(what) + " failed on fd " + std::to_string(fd_) + " " + errno_text(err);
    return false;
}

bool FdSink::write(ByteSpan data) {
    const uint8_t *p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return fail("write", errno);
        }
        if (n == 0) {
            return fail("write", EIO);
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

bool FdSink::write_vectored(const std::vector<ByteSpan> &buffers) {
    std::vector<struct iovec> iov;
    iov.reserve(buffers.size());
    for (const auto &b : buffers) {
        if (!b.empty()) {
            iov.push_back({const_cast<uint8_t *>(b.data()), b.size()});
        }
    }

    size_t idx = 0;
    while (idx < iov.size()) {
        const int count = static_cast<int>(std::min<size_t>(iov.size() - idx, IOV_MAX));
        ssize_t n = ::writev(fd_, iov.data() + idx, count);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return fail("writev", errno);
        }
        if (n == 0) {
            return fail("writev", EIO);
        }
        // Skip fully written buffers, then trim a partially written one.
        size_t written = static_cast<size_t>(n);
        while (idx < iov.size() && written >= iov[idx].iov_len) {
            written -= iov[idx].iov_len;
            ++idx;
        }
        if (written > 0) {
            iov[idx].iov_base = static_cast<uint8_t *>(iov[idx].iov_base) + written;
            iov[idx].iov_len -= written;
        }
    }
    return true;
}

bool FdSink::seek(uint64_t offset) {
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
        return fail("lseek", errno);
    }
    return true;
}

bool FdSink::sync() {
    if (::fsync(fd_) != 0) {
        return fail("fsync", errno);
    }
    return true;
}

bool FdSink::close() {
    if (!owns_fd_ || fd_ < 0) {
        return true;
    }
    const int rc = ::close(fd_);
    const int err = errno;
    const bool ok = rc == 0 || fail("close", err);
    fd_ = -1;
    return ok;
}

}  // namespace aviforge
