//
//  memory_sink.hpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "byte_sink.hpp"

namespace aviforge {

/// @ingroup api
/// Growable in-memory sink with a cursor. Writes past the end extend the buffer (any gap left
/// by a forward seek is zero-filled); writes inside it overwrite.
class MemorySink : public ByteSink {
   public:
    MemorySink() = default;

    bool write(ByteSpan data) override;
    bool seek(uint64_t offset) override;
    std::string last_error() const override { return {}; }

    const std::vector<uint8_t> &data() const { return data_; }
    std::vector<uint8_t> take();
    uint64_t position() const { return pos_; }

   private:
    std::vector<uint8_t> data_;
    uint64_t pos_ = 0;
};

}  // namespace aviforge
