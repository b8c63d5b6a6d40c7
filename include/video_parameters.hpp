//
//  video_parameters.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>

namespace aviforge {

/// @ingroup api
/// Stream parameters fixed for the lifetime of a writer.
struct VideoParameters {
    uint32_t width = 0;   ///< Frame width in pixels
    uint32_t height = 0;  ///< Frame height in pixels
    uint32_t fps = 0;     ///< Frames per second; must be non-zero
};

}  // namespace aviforge
