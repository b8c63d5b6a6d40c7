//
//  logging.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace aviforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI/job level name; unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Hex-preview helper used in debug logs to dump a short prefix of a frame payload.
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(std::span<const uint8_t> data, size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

// errno rendered the way open/write failures are reported.
inline std::string errno_text(int err) {
    std::ostringstream oss;
    oss << "errno=" << err << " (" << std::generic_category().message(err) << ")";
    return oss.str();
}

}  // namespace aviforge

inline constexpr aviforge::LogVerbosity af_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return aviforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return aviforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return aviforge::LogVerbosity::Info;
    }
    // Everything else (io/sink/index/etc.) treated as debug-level.
    return aviforge::LogVerbosity::Debug;
}

inline bool af_should_log(const char* level) {
    const auto current = aviforge::get_log_verbosity();
    const auto sev = af_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void af_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[AviForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[AviForge][" << level << "] " << msg << std::endl;
    }
}

#define AF_LOG(level, message)                                              \
    do {                                                                    \
        if (af_should_log(level)) {                                         \
            std::ostringstream _af_log_ss;                                  \
            _af_log_ss << message;                                          \
            af_log_impl(level, _af_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
