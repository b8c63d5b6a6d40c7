//
//  sink_program.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "sink_program.hpp"

#include <exception>
#include <utility>

#include "logging.hpp"

namespace aviforge {

ByteSpan SinkProgram::stage(std::vector<uint8_t> bytes) {
    staged_.push_back(std::move(bytes));
    const auto &stored = staged_.back();
    return ByteSpan(stored.data(), stored.size());
}

void SinkProgram::write(std::string label, std::vector<ByteSpan> buffers) {
    SinkOp op;
    op.kind = SinkOp::Kind::Write;
    op.label = std::move(label);
    op.buffers = std::move(buffers);
    ops_.push_back(std::move(op));
}

void SinkProgram::seek(std::string label, uint64_t offset) {
    SinkOp op;
    op.kind = SinkOp::Kind::Seek;
    op.label = std::move(label);
    op.offset = offset;
    ops_.push_back(std::move(op));
}

namespace {

AviStatus io_failure(const SinkOp &op, const std::string &detail) {
    std::string msg = std::string(error_description(AviError::Io)) + ": " + op.label;
    if (op.kind == SinkOp::Kind::Seek) {
        msg += " (seek to " + std::to_string(op.offset) + ")";
    }
    if (!detail.empty()) {
        msg += ": " + detail;
    }
    AF_LOG("error", msg);
    return error_status(AviError::Io, std::move(msg));
}

}  // namespace

AviStatus run_sink_program(ByteSink &sink, const SinkProgram &program) {
    for (const auto &op : program.ops()) {
        bool ok = false;
        if (op.kind == SinkOp::Kind::Seek) {
            ok = sink.seek(op.offset);
        } else if (op.buffers.size() == 1) {
            ok = sink.write(op.buffers.front());
        } else {
            ok = sink.write_vectored(op.buffers);
        }
        if (!ok) {
            return io_failure(op, sink.last_error());
        }
        AF_LOG("sink", op.label << " ok");
    }
    return ok_status();
}

AviStatus run_sink_program(AsyncByteSink &sink, const SinkProgram &program) {
    for (const auto &op : program.ops()) {
        std::future<bool> pending;
        if (op.kind == SinkOp::Kind::Seek) {
            pending = sink.seek(op.offset);
        } else if (op.buffers.size() == 1) {
            pending = sink.write(op.buffers.front());
        } else {
            pending = sink.write_vectored(op.buffers);
        }

        bool ok = false;
        try {
            ok = pending.get();
        } catch (const std::exception &e) {
            return io_failure(op, e.what());
        } catch (...) {
            return io_failure(op, "unknown exception");
        }
        if (!ok) {
            return io_failure(op, sink.last_error());
        }
        AF_LOG("sink", op.label << " ok");
    }
    return ok_status();
}

}  // namespace aviforge
