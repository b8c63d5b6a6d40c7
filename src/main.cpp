//
//  main.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "aviforge.hpp"
#include "aviforge_version.hpp"
#include "fourcc_utils.hpp"
#include "logging.hpp"
#include "riff_chunks.hpp"
#include <nlohmann/json.hpp>

namespace {

struct CliOverrides {
    std::optional<uint32_t> fps;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    bool use_async = false;
};

void print_usage() {
    std::cerr << "AviForge " << AVIFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage for reading:\n"
              << "  aviforge <input.avi> [--log-level warn|info|debug]\n"
              << "usage for writing:\n"
              << "  aviforge <job.json> [output.avi] [options]\n"
              << "  aviforge <frames_dir> <output.avi> [options]\n"
              << "Options:\n"
              << "  --fps N             Frame rate (default: job value, else 30).\n"
              << "  --size WxH          Frame size (default: job value, else first frame).\n"
              << "  --async             Write through the asynchronous writer.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "  --version           Print the version and exit.\n"
              << "A directory supplies all *.jpg/*.jpeg files sorted by name.\n"
              << "JSON is always written to stdout when reading.\n";
}

std::string fourcc_text(uint32_t v) {
    return is_printable_fourcc(v) ? fourcc_to_string(v) : std::to_string(v);
}

bool emit_json(const aviforge::AviSummary &s) {
    nlohmann::json j;
    j["file_size"] = s.file_size;
    j["riff_size"] = s.riff_size;
    j["width"] = s.width;
    j["height"] = s.height;
    j["fps"] = s.fps;
    j["micro_sec_per_frame"] = s.micro_sec_per_frame;
    j["total_frames"] = s.avih_total_frames;
    j["stream_length"] = s.stream_length;
    j["odml_total_frames"] = s.odml_total_frames;
    j["stream_type"] = fourcc_text(s.stream_type);
    j["handler"] = fourcc_text(s.handler);
    j["compression"] = fourcc_text(s.compression);
    j["movi_offset"] = s.movi_offset;
    j["movi_size"] = s.movi_size;
    j["index_consistent"] = s.index_consistent;

    nlohmann::json frames = nlohmann::json::array();
    for (const auto &e : s.index) {
        nlohmann::json f;
        f["offset"] = e.offset;
        f["size"] = e.size;
        f["keyframe"] = (e.flags & aviforge::kIndexKeyFrameFlag) != 0;
        frames.push_back(f);
    }
    j["frames"] = frames;

    std::cout << j.dump(2) << "\n";
    return true;
}

bool parse_count(const std::string &s, uint32_t &out) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 9) {
        return false;
    }
    out = static_cast<uint32_t>(std::stoul(s));
    return true;
}

int run_read(const std::string &input_path) {
    aviforge::AviSummary summary;
    auto status = aviforge::read_avi(input_path, summary);
    if (!status.ok) {
        AF_LOG("error", "aviforge: failed to read avi: " << status.message);
        return 1;
    }
    if (!emit_json(summary)) {
        AF_LOG("error", "aviforge: failed to emit JSON");
        return 1;
    }
    return 0;
}

int run_write(const std::vector<std::string> &positional, const CliOverrides &overrides) {
    aviforge::JobConfig job;
    const std::string &source = positional[0];
    if (std::filesystem::is_directory(source)) {
        if (positional.size() != 2) {
            std::cerr << "A frames directory needs an output path. See --help for usage.\n";
            return 2;
        }
        auto status = aviforge::collect_frame_files(source, job.frames);
        if (!status.ok) {
            AF_LOG("error", "aviforge: " << status.message);
            return 1;
        }
        if (job.frames.empty()) {
            AF_LOG("error", "aviforge: no *.jpg or *.jpeg files in " << source);
            return 1;
        }
    } else {
        auto status = aviforge::load_job(source, job);
        if (!status.ok) {
            AF_LOG("error", "aviforge: failed to load job: " << status.message);
            return 1;
        }
    }
    if (positional.size() == 2) {
        job.output = positional[1];
    }
    if (overrides.fps) {
        job.params.fps = *overrides.fps;
    }
    if (overrides.width) {
        job.params.width = *overrides.width;
        job.params.height = *overrides.height;
    }
    if (overrides.use_async) {
        job.use_async = true;
    }

    auto status = aviforge::run_job(job);
    if (!status.ok) {
        AF_LOG("error", "aviforge: failed to write avi (" << aviforge::error_name(status.error)
                                                          << "): " << status.message);
        return 1;
    }
    std::cout << "Wrote: " << job.output << "\n";
    return 0;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "AviForge " << AVIFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    CliOverrides overrides;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--async") {
            overrides.use_async = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            aviforge::set_log_verbosity(aviforge::parse_log_verbosity(argv[++i]));
        } else if (arg == "--fps" && i + 1 < argc) {
            uint32_t fps = 0;
            if (!parse_count(argv[++i], fps) || fps == 0) {
                std::cerr << "Invalid --fps value: " << argv[i] << "\n";
                return 2;
            }
            overrides.fps = fps;
        } else if (arg == "--size" && i + 1 < argc) {
            uint32_t w = 0;
            uint32_t h = 0;
            if (!aviforge::parse_frame_size(argv[++i], w, h)) {
                std::cerr << "Invalid --size value: " << argv[i] << " (expected WxH)\n";
                return 2;
            }
            overrides.width = w;
            overrides.height = h;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }
    if (positional.size() > 2) {
        std::cerr << "Invalid arguments. See --help for usage.\n";
        return 2;
    }

    // Reading mode: a single .avi argument.
    if (positional.size() == 1) {
        auto ext = std::filesystem::path(positional[0]).extension().string();
        for (auto &c : ext) {
            c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
        }
        if (ext == ".avi") {
            return run_read(positional[0]);
        }
    }
    return run_write(positional, overrides);
}
