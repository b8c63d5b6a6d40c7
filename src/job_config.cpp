//
//  job_config.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "job_config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

#include "logging.hpp"

using json = nlohmann::json;

namespace aviforge {

namespace {

AviStatus config_error(const std::string &what) {
    std::string msg = std::string(error_description(AviError::InvalidConfig)) + ": " + what;
    AF_LOG("error", msg);
    return error_status(AviError::InvalidConfig, std::move(msg));
}

std::string resolve_path(const std::filesystem::path &base, const std::string &p) {
    std::filesystem::path path(p);
    if (path.is_absolute() || base.empty()) {
        return path.string();
    }
    return (base / path).string();
}

bool read_u32_field(const json &j, const char *key, uint32_t &out, std::string &error) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    const auto &v = j[key];
    if (!v.is_number_integer()) {
        error = std::string("'") + key + "' must be an integer";
        return false;
    }
    const int64_t n = v.get<int64_t>();
    if (n < 0 || n > std::numeric_limits<uint32_t>::max()) {
        error = std::string("'") + key + "' out of range: " + std::to_string(n);
        return false;
    }
    out = static_cast<uint32_t>(n);
    return true;
}

AviStatus parse_job(const json &j, const std::filesystem::path &base, JobConfig &out) {
    if (!j.is_object()) {
        return config_error("job must be a JSON object");
    }
    JobConfig job;
    std::string error;
    if (!read_u32_field(j, "width", job.params.width, error) ||
        !read_u32_field(j, "height", job.params.height, error) ||
        !read_u32_field(j, "fps", job.params.fps, error)) {
        return config_error(error);
    }
    if (job.params.fps == 0) {
        return config_error("'fps' must be positive");
    }

    if (!j.contains("frames") || !j["frames"].is_array()) {
        return config_error("'frames' must be an array of paths");
    }
    job.frames.reserve(j["frames"].size());
    for (const auto &f : j["frames"]) {
        if (!f.is_string()) {
            return config_error("'frames' entries must be strings");
        }
        const auto p = f.get<std::string>();
        if (p.empty()) {
            return config_error("empty frame path");
        }
        job.frames.push_back(resolve_path(base, p));
    }

    if (j.contains("output")) {
        if (!j["output"].is_string()) {
            return config_error("'output' must be a string");
        }
        const auto p = j["output"].get<std::string>();
        job.output = p.empty() ? std::string() : resolve_path(base, p);
    }
    if (j.contains("async")) {
        if (!j["async"].is_boolean()) {
            return config_error("'async' must be a boolean");
        }
        job.use_async = j["async"].get<bool>();
    }

    AF_LOG("debug", "job frames=" << job.frames.size() << " size=" << job.params.width << "x"
                                  << job.params.height << " fps=" << job.params.fps
                                  << " output=" << job.output << " async=" << job.use_async);
    out = std::move(job);
    return ok_status();
}

AviStatus parse_job_text(const std::string &text, const std::filesystem::path &base,
                         JobConfig &out) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception &e) {
        return config_error(e.what());
    }
    return parse_job(j, base, out);
}

}  // namespace

AviStatus load_job(const std::string &job_path, JobConfig &out) {
    std::ifstream f(job_path);
    if (!f.is_open()) {
        std::string msg = "open failed for " + job_path + " " + errno_text(errno);
        AF_LOG("error", msg);
        return error_status(AviError::Io, std::move(msg));
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return parse_job_text(text, std::filesystem::path(job_path).parent_path(), out);
}

AviStatus collect_frame_files(const std::string &dir, std::vector<std::string> &out) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        std::string msg = "cannot list " + dir + ": " + ec.message();
        AF_LOG("error", msg);
        return error_status(AviError::Io, std::move(msg));
    }
    std::vector<std::string> files;
    for (const auto &entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        auto ext = entry.path().extension().string();
        for (auto &c : ext) {
            c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
        }
        if (ext == ".jpg" || ext == ".jpeg") {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    AF_LOG("debug", "collected " << files.size() << " frames from " << dir);
    out = std::move(files);
    return ok_status();
}

bool parse_frame_size(const std::string &text, uint32_t &width, uint32_t &height) {
    const auto x = text.find_first_of("xX");
    if (x == std::string::npos || x == 0 || x + 1 >= text.size()) {
        return false;
    }
    auto parse_part = [](const std::string &s, uint32_t &v) {
        if (s.empty() || s.size() > 10 ||
            !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        const uint64_t n = std::stoull(s);
        if (n > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
        v = static_cast<uint32_t>(n);
        return true;
    };
    uint32_t w = 0;
    uint32_t h = 0;
    if (!parse_part(text.substr(0, x), w) || !parse_part(text.substr(x + 1), h)) {
        return false;
    }
    width = w;
    height = h;
    return true;
}

#ifdef AVIFORGE_TESTING
namespace testing {
AviStatus parse_job_text_for_test(const std::string &text, const std::string &base_dir,
                                  JobConfig &out) {
    return parse_job_text(text, base_dir, out);
}
}  // namespace testing
#endif

}  // namespace aviforge
