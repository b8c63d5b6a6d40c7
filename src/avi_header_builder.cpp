//
//  avi_header_builder.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "avi_header_builder.hpp"

#include <stdexcept>

namespace aviforge {

namespace {

constexpr uint32_t kHdrlListSize = 224;
constexpr uint32_t kAvihSize = 56;
constexpr uint32_t kStrlListSize = 148;
constexpr uint32_t kStrhSize = 64;
constexpr uint32_t kStrfSize = 40;
constexpr uint32_t kOdmlListSize = 16;
constexpr uint32_t kDmlhSize = 4;

constexpr uint32_t kMaxBytesPerSec = 7000;
constexpr uint32_t kAvifHasIndex = 0x10;
constexpr uint16_t kBitCount = 24;

}  // namespace

uint32_t bitmap_image_size(uint32_t width, uint32_t height) {
    const uint32_t stride = (width * kBitCount / 8 + 3) & ~uint32_t{3};
    return stride * height;
}

// avih: main AVI header.
static void write_avih(std::vector<uint8_t> &p, const VideoParameters &params) {
    write_fourcc(p, "avih");
    write_u32le(p, kAvihSize);

    write_u32le(p, 1000000 / params.fps);  // microseconds per frame (truncated)
    write_u32le(p, kMaxBytesPerSec);
    write_u32le(p, 0);  // padding granularity
    write_u32le(p, kAvifHasIndex);
    write_u32le(p, 0);  // total frames, patched at finish
    write_u32le(p, 0);  // initial frames
    write_u32le(p, 1);  // streams
    write_u32le(p, 0);  // suggested buffer size
    write_u32le(p, params.width);
    write_u32le(p, params.height);

    // reserved.
    for (int i = 0; i < 4; ++i) {
        write_u32le(p, 0);
    }
}

// strh: video stream header, MJPG handler.
static void write_strh(std::vector<uint8_t> &p, const VideoParameters &params) {
    write_fourcc(p, "strh");
    write_u32le(p, kStrhSize);

    write_fourcc(p, "vids");
    write_fourcc(p, "MJPG");
    write_u32le(p, 0);   // flags
    write_u16le(p, 0);   // priority
    write_u16le(p, 0);   // language
    write_u32le(p, 0);   // initial frames
    write_u32le(p, params.fps);  // dwScale slot, carries the frame rate
    write_u32le(p, 0);   // dwRate
    write_u32le(p, 0);   // start
    write_u32le(p, 0);   // length, patched at finish
    write_u32le(p, 0);   // suggested buffer size
    write_u32le(p, 0);   // quality
    write_u32le(p, 0);   // sample size

    // frame rectangle: left, top, width, height.
    write_u32le(p, 0);
    write_u32le(p, 0);
    write_u32le(p, params.width);
    write_u32le(p, params.height);
}

// strf: BITMAPINFOHEADER.
static void write_strf(std::vector<uint8_t> &p, const VideoParameters &params) {
    write_fourcc(p, "strf");
    write_u32le(p, kStrfSize);

    write_u32le(p, kStrfSize);  // biSize
    write_u32le(p, params.width);
    write_u32le(p, params.height);
    write_u16le(p, 1);  // planes
    write_u16le(p, kBitCount);
    write_fourcc(p, "MJPG");
    write_u32le(p, bitmap_image_size(params.width, params.height));
    write_u32le(p, 0);  // x pels per meter
    write_u32le(p, 0);  // y pels per meter
    write_u32le(p, 0);  // colors used
    write_u32le(p, 0);  // colors important
}

// odml: OpenDML extended header announcing large-file index support.
static void write_odml(std::vector<uint8_t> &p) {
    write_fourcc(p, "LIST");
    write_u32le(p, kOdmlListSize);
    write_fourcc(p, "odml");
    write_fourcc(p, "dmlh");
    write_u32le(p, kDmlhSize);
    write_u32le(p, 0);  // total frames, patched at finish
}

std::vector<uint8_t> build_avi_header(const VideoParameters &params) {
    if (params.fps == 0) {
        throw std::invalid_argument("build_avi_header: fps must be non-zero");
    }

    std::vector<uint8_t> p;
    p.reserve(kAviHeaderSize);

    write_fourcc(p, "RIFF");
    write_u32le(p, 0);  // file size, patched at finish
    write_fourcc(p, "AVI ");

    write_fourcc(p, "LIST");
    write_u32le(p, kHdrlListSize);
    write_fourcc(p, "hdrl");
    write_avih(p, params);

    write_fourcc(p, "LIST");
    write_u32le(p, kStrlListSize);
    write_fourcc(p, "strl");
    write_strh(p, params);
    write_strf(p, params);
    write_odml(p);

    // movi LIST head; frame chunks follow directly.
    write_fourcc(p, "LIST");
    write_u32le(p, 0);  // movi size, patched at finish
    write_fourcc(p, "movi");

    if (p.size() != kAviHeaderSize) {
        throw std::logic_error("build_avi_header: header is not 256 bytes");
    }
    return p;
}

}  // namespace aviforge
