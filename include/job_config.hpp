//
//  job_config.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "avi_status.hpp"
#include "video_parameters.hpp"

namespace aviforge {

inline constexpr uint32_t kDefaultFps = 30;

/// @ingroup api
/// A write job: which JPEG files go into which AVI, and how.
///
/// JSON form:
/// `{"width":640,"height":480,"fps":25,"frames":["f0.jpg","f1.jpg"],"output":"out.avi",
///   "async":false}`
/// Relative paths resolve against the directory holding the job file. width/height of 0
/// (or absent) are inferred from the first frame.
struct JobConfig {
    VideoParameters params{0, 0, kDefaultFps};
    std::vector<std::string> frames;
    std::string output;
    bool use_async = false;
};

/// Load and validate a JSON job file.
AviStatus load_job(const std::string &job_path, JobConfig &out);

/// Collect `*.jpg` / `*.jpeg` files of a directory, sorted by name.
AviStatus collect_frame_files(const std::string &dir, std::vector<std::string> &out);

/// Parse "WxH" as given to --size.
bool parse_frame_size(const std::string &text, uint32_t &width, uint32_t &height);

#ifdef AVIFORGE_TESTING
namespace testing {
// Parse job JSON text as if it had been read from a file inside base_dir.
AviStatus parse_job_text_for_test(const std::string &text, const std::string &base_dir,
                                  JobConfig &out);
}  // namespace testing
#endif

}  // namespace aviforge
