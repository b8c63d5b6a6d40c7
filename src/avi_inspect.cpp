//
//  avi_inspect.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "avi_inspect.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

#include "fourcc_utils.hpp"
#include "logging.hpp"
#include "riff_chunks.hpp"

namespace aviforge {

namespace {

constexpr uint32_t kRiffTag = fourcc('R', 'I', 'F', 'F');
constexpr uint32_t kAviForm = fourcc('A', 'V', 'I', ' ');
constexpr uint32_t kListTag = fourcc('L', 'I', 'S', 'T');
constexpr uint32_t kHdrlType = fourcc('h', 'd', 'r', 'l');
constexpr uint32_t kMoviType = fourcc('m', 'o', 'v', 'i');
constexpr uint32_t kAvihTag = fourcc('a', 'v', 'i', 'h');
constexpr uint32_t kStrhTag = fourcc('s', 't', 'r', 'h');
constexpr uint32_t kStrfTag = fourcc('s', 't', 'r', 'f');
constexpr uint32_t kDmlhTag = fourcc('d', 'm', 'l', 'h');
constexpr int kMaxListDepth = 4;

struct RiffChunk {
    uint32_t tag = 0;
    uint32_t size = 0;
    size_t payload = 0;  // offset of the first payload byte
};

bool read_chunk(std::span<const uint8_t> data, size_t pos, size_t end, RiffChunk &c) {
    if (pos + kChunkHeaderSize > end) {
        return false;
    }
    c.tag = read_u32le(&data[pos]);
    c.size = read_u32le(&data[pos + 4]);
    c.payload = pos + kChunkHeaderSize;
    return c.payload + c.size <= end;
}

// Chunks are word aligned.
size_t next_chunk(const RiffChunk &c) { return c.payload + c.size + (c.size & 1); }

AviStatus malformed(const std::string &what) {
    std::string msg = std::string(error_description(AviError::MalformedContainer)) + ": " + what;
    AF_LOG("parser", msg);
    return error_status(AviError::MalformedContainer, std::move(msg));
}

uint32_t field(std::span<const uint8_t> data, const RiffChunk &c, size_t at) {
    return read_u32le(&data[c.payload + at]);
}

AviStatus parse_header_list(std::span<const uint8_t> data, size_t pos, size_t end, int depth,
                            AviSummary &out) {
    if (depth > kMaxListDepth) {
        return malformed("LIST nesting too deep");
    }
    while (pos < end) {
        RiffChunk c;
        if (!read_chunk(data, pos, end, c)) {
            return malformed("truncated chunk at " + std::to_string(pos));
        }
        if (c.tag == kListTag) {
            if (c.size < 4) {
                return malformed("empty LIST at " + std::to_string(pos));
            }
            AviStatus st = parse_header_list(data, c.payload + 4, c.payload + c.size, depth + 1, out);
            if (!st.ok) {
                return st;
            }
        } else if (c.tag == kAvihTag) {
            if (c.size < 40) {
                return malformed("avih too small");
            }
            out.micro_sec_per_frame = field(data, c, 0);
            out.avih_total_frames = field(data, c, 16);
            out.width = field(data, c, 32);
            out.height = field(data, c, 36);
        } else if (c.tag == kStrhTag) {
            if (c.size < 36) {
                return malformed("strh too small");
            }
            out.stream_type = field(data, c, 0);
            out.handler = field(data, c, 4);
            out.fps = field(data, c, 20);
            out.stream_length = field(data, c, 32);
        } else if (c.tag == kStrfTag) {
            if (c.size < 24) {
                return malformed("strf too small");
            }
            out.compression = field(data, c, 16);
            out.bitmap_size_image = field(data, c, 20);
        } else if (c.tag == kDmlhTag) {
            if (c.size < 4) {
                return malformed("dmlh too small");
            }
            out.odml_total_frames = field(data, c, 0);
        } else {
            AF_LOG("parser", "skipping header chunk '" << fourcc_to_string(c.tag) << "' size="
                                                       << c.size);
        }
        pos = next_chunk(c);
    }
    return ok_status();
}

bool check_index(std::span<const uint8_t> data, const AviSummary &s) {
    const uint64_t movi_end = s.movi_offset + s.movi_size;
    for (const auto &e : s.index) {
        const uint64_t pos = s.movi_offset + e.offset;
        if (pos + kChunkHeaderSize + e.size > movi_end || pos + kChunkHeaderSize > data.size()) {
            return false;
        }
        const size_t p = static_cast<size_t>(pos);
        if (read_u32le(&data[p]) != e.tag || read_u32le(&data[p + 4]) != e.size) {
            return false;
        }
    }
    return true;
}

}  // namespace

AviStatus parse_avi(std::span<const uint8_t> data, AviSummary &out) {
    out = AviSummary{};
    out.file_size = data.size();
    if (data.size() < kAviHeaderSize) {
        return malformed("shorter than the 256-byte header");
    }
    if (read_u32le(&data[0]) != kRiffTag || read_u32le(&data[8]) != kAviForm) {
        return malformed("missing RIFF/AVI signature");
    }
    out.riff_size = read_u32le(&data[4]);
    const uint64_t riff_end = uint64_t{out.riff_size} + 8;
    if (riff_end < 12 || riff_end > data.size()) {
        return malformed("RIFF size " + std::to_string(out.riff_size) + " does not match " +
                         std::to_string(data.size()) + " bytes (not finalized?)");
    }
    const size_t end = static_cast<size_t>(riff_end);

    bool have_hdrl = false;
    bool have_movi = false;
    bool have_idx1 = false;
    size_t pos = 12;
    while (pos < end) {
        RiffChunk c;
        if (!read_chunk(data, pos, end, c)) {
            return malformed("truncated top-level chunk at " + std::to_string(pos));
        }
        if (c.tag == kListTag && c.size >= 4) {
            const uint32_t list_type = read_u32le(&data[c.payload]);
            if (list_type == kHdrlType) {
                AviStatus st =
                    parse_header_list(data, c.payload + 4, c.payload + c.size, 1, out);
                if (!st.ok) {
                    return st;
                }
                have_hdrl = true;
            } else if (list_type == kMoviType) {
                out.movi_offset = c.payload;
                out.movi_size = c.size;
                have_movi = true;
            }
        } else if (c.tag == kIndexChunkTag) {
            out.index.reserve(c.size / kIndexEntrySize);
            for (size_t at = 0; at + kIndexEntrySize <= c.size; at += kIndexEntrySize) {
                AviIndexEntry e;
                e.tag = field(data, c, at);
                e.flags = field(data, c, at + 4);
                e.offset = field(data, c, at + 8);
                e.size = field(data, c, at + 12);
                out.index.push_back(e);
            }
            have_idx1 = true;
        }
        pos = next_chunk(c);
    }

    if (!have_hdrl) {
        return malformed("no hdrl LIST");
    }
    if (!have_movi) {
        return malformed("no movi LIST");
    }
    if (!have_idx1) {
        return malformed("no idx1 chunk");
    }
    out.index_consistent = check_index(data, out);
    return ok_status();
}

AviStatus read_avi(const std::string &path, AviSummary &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        std::string msg = "open failed for " + path + " " + errno_text(errno);
        AF_LOG("error", msg);
        return error_status(AviError::Io, std::move(msg));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    AF_LOG("debug", "read_avi " << path << " bytes=" << bytes.size());
    return parse_avi(bytes, out);
}

}  // namespace aviforge
