//
//  byte_sink.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <future>
#include <span>
#include <string>
#include <vector>

namespace aviforge {

using ByteSpan = std::span<const uint8_t>;

/// @ingroup api
/// Synchronous byte destination: sequential writes plus absolute seeks. No reads.
/// Operations return false on failure; last_error() describes the most recent failure.
class ByteSink {
   public:
    virtual ~ByteSink() = default;

    // Write at the current position and advance it.
    virtual bool write(ByteSpan data) = 0;

    // Write the buffers back to back without concatenating them. The default issues one
    // write() per buffer; sinks with scatter/gather support override it.
    virtual bool write_vectored(const std::vector<ByteSpan> &buffers);

    // Move the write position to an absolute offset from the start.
    virtual bool seek(uint64_t offset) = 0;

    virtual std::string last_error() const = 0;
};

/// @ingroup api
/// Asynchronous counterpart of ByteSink. Each operation completes through its future; the
/// sink must apply operations in the order they were issued. Buffers passed in must remain
/// valid until the returned future is ready.
class AsyncByteSink {
   public:
    virtual ~AsyncByteSink() = default;

    virtual std::future<bool> write(ByteSpan data) = 0;
    virtual std::future<bool> write_vectored(std::vector<ByteSpan> buffers) = 0;
    virtual std::future<bool> seek(uint64_t offset) = 0;

    virtual std::string last_error() const = 0;
};

}  // namespace aviforge
