//
//  aviforge.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "avi_inspect.hpp"
#include "avi_status.hpp"
#include "job_config.hpp"
#include "mjpeg_writer.hpp"
#include "video_parameters.hpp"

namespace aviforge {

/// @ingroup api
/// @{

/**
 * @brief Return the AviForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();

/**
 * @brief Stream a list of JPEG files into an MJPEG AVI.
 *
 * Frames are loaded one at a time and written in list order; the payload is never held in
 * full. A width/height of 0 is inferred from the first frame's SOF header.
 *
 * @param jpeg_paths Frame files in presentation order.
 * @param params Frame dimensions and rate; fps must be positive.
 * @param output_path Destination .avi file (created or truncated).
 * @param use_async When true, frames go through AsyncMjpegWriter over a ThreadedAsyncSink so
 *        loading the next frame overlaps writing the previous ones.
 */
AviStatus write_avi_from_jpegs(const std::vector<std::string> &jpeg_paths,
                               const VideoParameters &params, const std::string &output_path,
                               bool use_async = false);

/// Run an already loaded job (frames, parameters, output, sync or async path).
AviStatus run_job(const JobConfig &job);

/// Run a JSON job file (see JobConfig). A non-empty output_override replaces the job's output.
AviStatus write_avi_from_job(const std::string &job_path, const std::string &output_override = {});

/// @}

}  // namespace aviforge
