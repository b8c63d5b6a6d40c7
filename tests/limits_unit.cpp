// Limit enforcement through the writer: frame count, single frame size, 2 GB file ceiling.
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "mjpeg_writer.hpp"

using aviforge::AviError;
using aviforge::AviStatus;
using aviforge::ByteSpan;
using aviforge::MjpegWriter;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        fprintf(stderr, "[limits_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

// Discards payload; tracks the file extent and the patched RIFF size.
class NullSink : public aviforge::ByteSink {
   public:
    bool write(ByteSpan data) override {
        if (pos_ == 4 && data.size() == 4) {
            riff_size = uint32_t(data[0]) | (uint32_t(data[1]) << 8) |
                        (uint32_t(data[2]) << 16) | (uint32_t(data[3]) << 24);
        }
        pos_ += data.size();
        extent = std::max(extent, pos_);
        return true;
    }
    bool seek(uint64_t offset) override {
        pos_ = offset;
        return true;
    }
    std::string last_error() const override { return {}; }

    uint64_t extent = 0;
    uint32_t riff_size = 0;

   private:
    uint64_t pos_ = 0;
};

bool test_frame_count_limit() {
    NullSink sink;
    AviStatus st;
    auto writer = MjpegWriter::create(sink, {16, 16, 30}, st);
    if (!writer) {
        return check(false, "create");
    }
    const std::vector<uint8_t> frame = {0xFF, 0xD8};
    bool ok = true;
    for (uint32_t i = 0; i < aviforge::kMaxFrameCount; ++i) {
        if (!writer->add_frame(frame).ok) {
            ok &= check(false, "frame " + std::to_string(i) + " rejected early");
            break;
        }
    }
    ok &= check(writer->frame_count() == aviforge::kMaxFrameCount, "1,000,000 frames accepted");
    const uint64_t extent = sink.extent;
    auto r = writer->add_frame(frame);
    ok &= check(!r.ok && r.error == AviError::FrameCountExceeded, "frame 1,000,001 refused");
    ok &= check(sink.extent == extent, "refused frame wrote nothing");
    ok &= check(writer->frame_count() == aviforge::kMaxFrameCount, "count unchanged");

    ok &= check(writer->finish().ok, "finish at the frame limit");
    const uint64_t n = aviforge::kMaxFrameCount;
    ok &= check(sink.riff_size == 256 + 2 * n + 24 * n, "riff size at the frame limit");
    ok &= check(sink.extent == 256 + 10 * n + 8 + 16 * n, "file extent at the frame limit");
    return ok;
}

bool test_file_size_limit() {
    NullSink sink;
    AviStatus st;
    auto writer = MjpegWriter::create(sink, {16, 16, 30}, st);
    if (!writer) {
        return check(false, "create");
    }
    const std::vector<uint8_t> frame(64u << 20, 0xAB);
    bool ok = true;
    AviStatus r;
    size_t accepted = 0;
    for (int i = 0; i < 40; ++i) {
        r = writer->add_frame(frame);
        if (!r.ok) {
            break;
        }
        ++accepted;
    }
    // 256 + 31 * (8 + 64 MiB + 16) fits below 2^31 - 1; the 32nd projection does not.
    ok &= check(accepted == 31, "31 frames of 64 MiB accepted");
    ok &= check(!r.ok && r.error == AviError::FileSizeExceeded, "32nd frame hits the ceiling");
    ok &= check(sink.extent < aviforge::kMaxAviFileSize, "ceiling never crossed");
    ok &= check(writer->estimated_file_size() <= aviforge::kMaxAviFileSize, "estimate bounded");

    ok &= check(writer->finish().ok, "finish below the ceiling");
    const uint64_t expect = 256 + 31 * ((64u << 20) + 24ull);
    ok &= check(sink.riff_size == expect, "riff size after 31 large frames");
    ok &= check(sink.extent == expect + 8, "file length = riff size + 8");
    return ok;
}

bool test_frame_size_limit() {
    NullSink sink;
    AviStatus st;
    auto writer = MjpegWriter::create(sink, {16, 16, 30}, st);
    if (!writer) {
        return check(false, "create");
    }
    // 64 views of one 64 MiB buffer describe a 4 GiB frame without allocating it.
    const std::vector<uint8_t> block(64u << 20, 0x11);
    std::vector<ByteSpan> fragments(64, ByteSpan(block));
    auto r = writer->add_frame_vectored(fragments);
    bool ok = check(!r.ok && r.error == AviError::FrameSizeExceeded, "4 GiB frame refused");
    ok &= check(sink.extent == 256, "nothing written for the oversized frame");
    ok &= check(writer->frame_count() == 0, "count unchanged");

    fragments.pop_back();
    r = writer->add_frame_vectored(fragments);
    ok &= check(!r.ok && r.error == AviError::FileSizeExceeded,
                "u32-sized frame still refused by the file ceiling");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_frame_count_limit();
    ok &= test_file_size_limit();
    ok &= test_frame_size_limit();
    return ok ? 0 : 1;
}
