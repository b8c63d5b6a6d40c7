// Asynchronous writer: byte equality with the synchronous writer, ordering, error propagation.
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "memory_sink.hpp"
#include "mjpeg_writer.hpp"
#include "test_utils.hpp"
#include "threaded_async_sink.hpp"

using aviforge::AsyncMjpegWriter;
using aviforge::AviError;
using aviforge::AviStatus;
using aviforge::ByteSpan;
using aviforge::MemorySink;
using aviforge::ThreadedAsyncSink;
using aviforge::VideoParameters;
using aviforge::WriterPhase;
using test_utils::pattern_bytes;
using test_utils::u32_at;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        fprintf(stderr, "[async_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

std::vector<std::vector<uint8_t>> make_frames() {
    std::vector<std::vector<uint8_t>> frames;
    for (size_t i = 0; i < 24; ++i) {
        frames.push_back(pattern_bytes(50 + i * 13, static_cast<uint8_t>(i)));
    }
    return frames;
}

std::vector<uint8_t> write_sync(const VideoParameters &params,
                                const std::vector<std::vector<uint8_t>> &frames) {
    MemorySink sink;
    AviStatus st;
    auto writer = aviforge::MjpegWriter::create(sink, params, st);
    if (!writer) {
        return {};
    }
    for (const auto &f : frames) {
        if (!writer->add_frame(f).ok) {
            return {};
        }
    }
    return writer->finish().ok ? sink.take() : std::vector<uint8_t>{};
}

// Async sink whose operations complete immediately; fails (or throws) from a chosen op on.
class ScriptedAsyncSink : public aviforge::AsyncByteSink {
   public:
    enum class Mode { Ok, FailFrom, ThrowFrom, ThrowIntFrom };
    ScriptedAsyncSink(Mode mode, int from) : mode_(mode), from_(from) {}

    std::future<bool> write(ByteSpan data) override {
        return complete([&] { return inner_.write(data); });
    }
    std::future<bool> write_vectored(std::vector<ByteSpan> buffers) override {
        return complete([&] { return inner_.write_vectored(buffers); });
    }
    std::future<bool> seek(uint64_t offset) override {
        return complete([&] { return inner_.seek(offset); });
    }
    std::string last_error() const override { return "scripted failure"; }

   private:
    template <typename Op>
    std::future<bool> complete(Op op) {
        std::promise<bool> p;
        const bool due = ops_++ >= from_;
        if (due && mode_ == Mode::ThrowFrom) {
            p.set_exception(std::make_exception_ptr(std::runtime_error("device vanished")));
        } else if (due && mode_ == Mode::ThrowIntFrom) {
            p.set_exception(std::make_exception_ptr(7));
        } else if (due && mode_ == Mode::FailFrom) {
            p.set_value(false);
        } else {
            p.set_value(op());
        }
        return p.get_future();
    }

    MemorySink inner_;
    Mode mode_;
    int from_;
    int ops_ = 0;
};

bool test_sync_async_equality() {
    const VideoParameters params{640, 360, 25};
    auto frames = make_frames();
    auto reference = write_sync(params, frames);

    MemorySink sink;
    bool ok = true;
    {
        ThreadedAsyncSink async_sink(sink);
        AsyncMjpegWriter writer(async_sink);
        ok &= check(writer.open(params).get().ok, "open");
        for (const auto &f : frames) {
            ok &= check(writer.add_frame(f).get().ok, "add");
        }
        ok &= check(writer.finish().get().ok, "finish");
        ok &= check(writer.phase() == WriterPhase::Finalized, "finalized");
    }
    ok &= check(!reference.empty() && sink.data() == reference, "async output equals sync output");
    return ok;
}

bool test_pipelined_ordering() {
    const VideoParameters params{64, 64, 12};
    auto frames = make_frames();
    auto reference = write_sync(params, frames);

    MemorySink sink;
    bool ok = true;
    {
        ThreadedAsyncSink async_sink(sink);
        AsyncMjpegWriter writer(async_sink);
        // Issue everything before awaiting anything.
        std::vector<std::future<AviStatus>> pending;
        pending.push_back(writer.open(params));
        for (size_t i = 0; i < frames.size(); ++i) {
            if (i % 3 == 0) {
                auto &f = frames[i];
                const size_t half = f.size() / 2;
                pending.push_back(writer.add_frame_vectored(
                    {ByteSpan(f.data(), half), ByteSpan(f.data() + half, f.size() - half)}));
            } else {
                pending.push_back(writer.add_frame(frames[i]));
            }
        }
        pending.push_back(writer.finish());
        for (size_t i = 0; i < pending.size(); ++i) {
            ok &= check(pending[i].get().ok, "queued op " + std::to_string(i));
        }
        ok &= check(writer.frame_count() == frames.size(), "all frames counted");
    }
    ok &= check(sink.data() == reference, "pipelined output equals sync output");
    return ok;
}

bool test_async_phase_errors() {
    ScriptedAsyncSink sink(ScriptedAsyncSink::Mode::Ok, 0);
    AsyncMjpegWriter writer(sink);
    auto frame = pattern_bytes(8, 1);
    auto r = writer.add_frame(frame).get();
    bool ok = check(r.error == AviError::NotStarted, "async add before open");
    r = writer.open({8, 8, 0}).get();
    ok &= check(r.error == AviError::InvalidFrameSize, "async fps 0");
    ok &= check(writer.phase() == WriterPhase::Idle, "refused open stays idle");
    ok &= check(writer.open({8, 8, 30}).get().ok, "async open");
    r = writer.add_frame(ByteSpan()).get();
    ok &= check(r.error == AviError::InvalidFrameSize, "async empty frame");
    ok &= check(writer.finish().get().ok, "async finish");
    r = writer.finish().get();
    ok &= check(r.error == AviError::AlreadyFinalized, "async finish twice");
    return ok;
}

bool test_async_io_failure() {
    auto frame = pattern_bytes(30, 4);
    bool ok = true;
    {
        // ops: header, frame 0, frame 1 fails.
        ScriptedAsyncSink sink(ScriptedAsyncSink::Mode::FailFrom, 2);
        AsyncMjpegWriter writer(sink);
        ok &= check(writer.open({8, 8, 30}).get().ok, "open");
        auto first = writer.add_frame(frame);
        auto second = writer.add_frame(frame);
        ok &= check(first.get().ok, "frame before failure");
        auto r = second.get();
        ok &= check(r.error == AviError::Io, "frame io failure surfaces");
        ok &= check(r.message.find("frame 1 chunk") != std::string::npos, "failure context");
        ok &= check(r.message.find("scripted failure") != std::string::npos, "sink error text");
        ok &= check(writer.frame_count() == 1, "failed frame not counted");
    }
    {
        ScriptedAsyncSink sink(ScriptedAsyncSink::Mode::ThrowFrom, 1);
        AsyncMjpegWriter writer(sink);
        ok &= check(writer.open({8, 8, 30}).get().ok, "open");
        auto r = writer.add_frame(frame).get();
        ok &= check(r.error == AviError::Io, "exception from sink becomes io error");
        ok &= check(r.message.find("device vanished") != std::string::npos, "exception text");
    }
    {
        // Sink futures may carry exceptions of any type; none reaches the caller.
        ScriptedAsyncSink sink(ScriptedAsyncSink::Mode::ThrowIntFrom, 1);
        AsyncMjpegWriter writer(sink);
        ok &= check(writer.open({8, 8, 30}).get().ok, "open");
        auto frame_result = writer.add_frame(frame);
        auto finish_result = writer.finish();
        AviStatus r;
        bool escaped = false;
        try {
            r = frame_result.get();
        } catch (const int &) {
            escaped = true;
        }
        ok &= check(!escaped, "non-standard exception does not escape");
        ok &= check(r.error == AviError::Io, "non-standard exception becomes io error");
        ok &= check(r.message.find("unknown exception") != std::string::npos,
                    "non-standard exception context");
        ok &= check(finish_result.get().error == AviError::Io, "later operations still resolve");
    }
    {
        ScriptedAsyncSink sink(ScriptedAsyncSink::Mode::FailFrom, 0);
        AsyncMjpegWriter writer(sink);
        auto r = writer.open({8, 8, 30}).get();
        ok &= check(r.error == AviError::Io, "header failure");
        ok &= check(writer.phase() == WriterPhase::Finalized, "failed async open is terminal");
    }
    return ok;
}

bool test_concurrent_callers() {
    MemorySink sink;
    const size_t per_thread = 200;
    std::vector<uint8_t> even = pattern_bytes(40, 1);
    std::vector<uint8_t> odd = pattern_bytes(41, 2);
    bool ok = true;
    {
        ThreadedAsyncSink async_sink(sink);
        AsyncMjpegWriter writer(async_sink);
        ok &= check(writer.open({32, 32, 30}).get().ok, "open");
        auto worker = [&writer, per_thread](const std::vector<uint8_t> &frame) {
            bool all = true;
            for (size_t i = 0; i < per_thread; ++i) {
                all &= writer.add_frame(frame).get().ok;
            }
            return all;
        };
        auto a = std::async(std::launch::async, worker, std::cref(even));
        auto b = std::async(std::launch::async, worker, std::cref(odd));
        ok &= check(a.get() && b.get(), "all concurrent adds succeed");
        ok &= check(writer.frame_count() == 2 * per_thread, "no frame lost");
        ok &= check(writer.jpeg_total_size() == per_thread * (40 + 42), "total size consistent");
        ok &= check(writer.finish().get().ok, "finish");
    }
    const auto &out = sink.data();
    const uint64_t expect_riff = 256 + per_thread * (40 + 42) + 2 * per_thread * 24;
    ok &= check(u32_at(out, 4) == expect_riff, "riff size after concurrent adds");
    ok &= check(out.size() == expect_riff + 8, "file length after concurrent adds");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_sync_async_equality();
    ok &= test_pipelined_ordering();
    ok &= test_async_phase_errors();
    ok &= test_async_io_failure();
    ok &= test_concurrent_callers();
    return ok ? 0 : 1;
}
