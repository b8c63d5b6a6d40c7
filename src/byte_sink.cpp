//
//  byte_sink.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "byte_sink.hpp"

namespace aviforge {

bool ByteSink::write_vectored(const std::vector<ByteSpan> &buffers) {
    for (const auto &buffer : buffers) {
        if (buffer.empty()) {
            continue;
        }
        if (!write(buffer)) {
            return false;
        }
    }
    return true;
}

}  // namespace aviforge
