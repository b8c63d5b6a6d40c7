//
//  memory_sink.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "memory_sink.hpp"

#include <algorithm>
#include <utility>

namespace aviforge {

bool MemorySink::write(ByteSpan data) {
    if (data.empty()) {
        return true;
    }
    const uint64_t end = pos_ + data.size();
    if (end > data_.size()) {
        data_.resize(static_cast<size_t>(end), 0);
    }
    std::copy(data.begin(), data.end(), data_.begin() + static_cast<std::ptrdiff_t>(pos_));
    pos_ = end;
    return true;
}

bool MemorySink::seek(uint64_t offset) {
    pos_ = offset;
    return true;
}

std::vector<uint8_t> MemorySink::take() {
    pos_ = 0;
    return std::exchange(data_, {});
}

}  // namespace aviforge
