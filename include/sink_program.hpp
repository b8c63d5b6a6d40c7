//
//  sink_program.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "avi_status.hpp"
#include "byte_sink.hpp"

namespace aviforge {

// One sink operation: a (possibly vectored) write at the current position, or a seek.
struct SinkOp {
    enum class Kind { Write, Seek };

    Kind kind = Kind::Write;
    std::string label;              // context for error messages, e.g. "frame 3 chunk"
    uint64_t offset = 0;            // Seek target
    std::vector<ByteSpan> buffers;  // Write payload, in order
};

// Ordered list of sink operations produced by the writer core. Bytes the program generates
// itself (chunk headers, padding, idx1, header patches) are staged here and outlive every
// span that refers to them; caller buffers are referenced, not copied.
class SinkProgram {
   public:
    SinkProgram() = default;
    SinkProgram(SinkProgram &&) = default;
    SinkProgram &operator=(SinkProgram &&) = default;
    SinkProgram(const SinkProgram &) = delete;
    SinkProgram &operator=(const SinkProgram &) = delete;

    ByteSpan stage(std::vector<uint8_t> bytes);
    void write(std::string label, std::vector<ByteSpan> buffers);
    void seek(std::string label, uint64_t offset);

    const std::vector<SinkOp> &ops() const { return ops_; }


   private:
    std::deque<std::vector<uint8_t>> staged_;
    std::vector<SinkOp> ops_;
};

// Blocking strategy: run every operation to completion on the calling thread.
AviStatus run_sink_program(ByteSink &sink, const SinkProgram &program);

// Suspending strategy: issue each operation and wait for its future before the next one.
AviStatus run_sink_program(AsyncByteSink &sink, const SinkProgram &program);

}  // namespace aviforge
