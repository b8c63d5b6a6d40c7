// Minimal RIFF/JPEG helpers for tests only (kept independent of the
// library code to avoid self-consistency bugs).
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

namespace test_utils {

inline uint32_t u32_at(const std::vector<uint8_t> &buf, size_t pos) {
    if (pos + 4 > buf.size()) {
        return 0xFFFFFFFFu;
    }
    return uint32_t(buf[pos]) | (uint32_t(buf[pos + 1]) << 8) | (uint32_t(buf[pos + 2]) << 16) |
           (uint32_t(buf[pos + 3]) << 24);
}

inline uint16_t u16_at(const std::vector<uint8_t> &buf, size_t pos) {
    if (pos + 2 > buf.size()) {
        return 0xFFFF;
    }
    return static_cast<uint16_t>(buf[pos] | (buf[pos + 1] << 8));
}

inline std::string tag_at(const std::vector<uint8_t> &buf, size_t pos) {
    if (pos + 4 > buf.size()) {
        return {};
    }
    return std::string(reinterpret_cast<const char *>(buf.data() + pos), 4);
}

inline void put_u32(std::vector<uint8_t> &buf, size_t pos, uint32_t v) {
    buf[pos] = v & 0xFF;
    buf[pos + 1] = (v >> 8) & 0xFF;
    buf[pos + 2] = (v >> 16) & 0xFF;
    buf[pos + 3] = (v >> 24) & 0xFF;
}

// Deterministic non-constant payload so misplaced bytes show up in comparisons.
inline std::vector<uint8_t> pattern_bytes(size_t len, uint8_t seed) {
    std::vector<uint8_t> out(len);
    for (size_t i = 0; i < len; ++i) {
        out[i] = static_cast<uint8_t>(seed + i * 7);
    }
    return out;
}

// Baseline JPEG skeleton: SOI, SOF0 (3 components, 4:2:0), SOS, filler scan data, EOI.
// Not decodable, but carries the markers header probes look for.
inline std::vector<uint8_t> make_test_jpeg(uint16_t width, uint16_t height, size_t scan_len = 32,
                                           uint8_t sof_marker = 0xC0) {
    std::vector<uint8_t> j = {0xFF, 0xD8};
    // APP0 JFIF.
    const uint8_t app0[] = {0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00, 0x01,
                            0x01, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00};
    j.insert(j.end(), std::begin(app0), std::end(app0));
    const uint8_t sof[] = {0xFF,
                           sof_marker,
                           0x00,
                           0x11,
                           0x08,
                           static_cast<uint8_t>(height >> 8),
                           static_cast<uint8_t>(height & 0xFF),
                           static_cast<uint8_t>(width >> 8),
                           static_cast<uint8_t>(width & 0xFF),
                           0x03,
                           0x01,
                           0x22,
                           0x00,
                           0x02,
                           0x11,
                           0x01,
                           0x03,
                           0x11,
                           0x01};
    j.insert(j.end(), std::begin(sof), std::end(sof));
    const uint8_t sos[] = {0xFF, 0xDA, 0x00, 0x0C, 0x03, 0x01, 0x00,
                           0x02, 0x11, 0x03, 0x11, 0x00, 0x3F, 0x00};
    j.insert(j.end(), std::begin(sos), std::end(sos));
    for (size_t i = 0; i < scan_len; ++i) {
        j.push_back(static_cast<uint8_t>(0x10 + (i % 0x60)));
    }
    j.push_back(0xFF);
    j.push_back(0xD9);
    return j;
}

inline std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::nullopt;
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)),
                                std::istreambuf_iterator<char>());
}

inline bool write_file(const std::filesystem::path &path, const std::vector<uint8_t> &data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return out.good();
}

// Fresh per-process scratch directory under the system temp dir.
inline std::filesystem::path make_temp_dir(const std::string &name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("aviforge_" + name + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

}  // namespace test_utils
