//
//  avi_status.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace aviforge {

/// @ingroup api
/// Failure kinds reported by the writer. `None` accompanies a successful status.
enum class AviError {
    None,
    InvalidFrameSize,    ///< empty frame, or fps == 0 at open
    FrameCountExceeded,  ///< frame count limit (1,000,000) reached
    FrameSizeExceeded,   ///< a single frame does not fit a 32-bit chunk size
    FileSizeExceeded,    ///< the RIFF 2 GB limit or a 32-bit header field would overflow
    Io,                  ///< the sink failed a write or seek
    NotStarted,          ///< operation issued before open()
    AlreadyFinalized,    ///< operation issued after the header/finish was written
    MalformedContainer,  ///< inspected data is not a finalized MJPEG AVI
    InvalidConfig,       ///< job file or CLI input cannot be turned into a write job
};

/**
 * @brief Result object with success flag, error kind and optional message.
 *
 * When `ok == true`, `error` is `AviError::None` and `message` is empty. On failure,
 * `message` contains a short description including the failing operation.
 */
struct AviStatus {
    bool ok{false};
    AviError error{AviError::None};
    std::string message;
};

inline AviStatus ok_status() { return AviStatus{true, AviError::None, {}}; }

inline AviStatus error_status(AviError error, std::string msg = {}) {
    return AviStatus{false, error, std::move(msg)};
}

/// Stable name for an error kind (used in logs and CLI output).
const char *error_name(AviError error);

/// Default human-readable description for an error kind.
const char *error_description(AviError error);

}  // namespace aviforge
