//
//  avi_status.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "avi_status.hpp"

namespace aviforge {

const char *error_name(AviError error) {
    switch (error) {
        case AviError::None:
            return "none";
        case AviError::InvalidFrameSize:
            return "invalid_frame_size";
        case AviError::FrameCountExceeded:
            return "frame_count_exceeded";
        case AviError::FrameSizeExceeded:
            return "frame_size_exceeded";
        case AviError::FileSizeExceeded:
            return "file_size_exceeded";
        case AviError::Io:
            return "io";
        case AviError::NotStarted:
            return "not_started";
        case AviError::AlreadyFinalized:
            return "already_finalized";
        case AviError::MalformedContainer:
            return "malformed_container";
        case AviError::InvalidConfig:
            return "invalid_config";
    }
    return "unknown";
}

const char *error_description(AviError error) {
    switch (error) {
        case AviError::None:
            return "ok";
        case AviError::InvalidFrameSize:
            return "Invalid frame size";
        case AviError::FrameCountExceeded:
            return "Frame count limit exceeded";
        case AviError::FrameSizeExceeded:
            return "Frame size exceeds u32 limit";
        case AviError::FileSizeExceeded:
            return "AVI file size limit exceeded (2GB)";
        case AviError::Io:
            return "IO error";
        case AviError::NotStarted:
            return "Writer has not been opened";
        case AviError::AlreadyFinalized:
            return "Writer already finalized";
        case AviError::MalformedContainer:
            return "Malformed AVI container";
        case AviError::InvalidConfig:
            return "Invalid job configuration";
    }
    return "unknown error";
}

}  // namespace aviforge
