//
//  jpeg_info.cpp
//  AviForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "jpeg_info.hpp"

namespace aviforge {

namespace {

bool is_sof_marker(uint8_t marker) {
    // SOF0-3, 5-7, 9-11, 13-15; C4 (DHT), C8 (JPG) and CC (DAC) share the range.
    return (marker >= 0xC0 && marker <= 0xC3) || (marker >= 0xC5 && marker <= 0xC7) ||
           (marker >= 0xC9 && marker <= 0xCB) || (marker >= 0xCD && marker <= 0xCF);
}

bool is_progressive_sof(uint8_t marker) {
    return marker == 0xC2 || marker == 0xC6 || marker == 0xCA || marker == 0xCE;
}

}  // namespace

bool has_jpeg_soi(std::span<const uint8_t> data) {
    return data.size() >= 2 && data[0] == 0xFF && data[1] == 0xD8;
}

std::optional<JpegInfo> probe_jpeg(std::span<const uint8_t> data) {
    if (data.size() < 10 || !has_jpeg_soi(data)) {
        return std::nullopt;
    }

    size_t i = 2;
    while (i + 3 < data.size()) {
        if (data[i] != 0xFF) {
            ++i;
            continue;
        }
        const uint8_t marker = data[i + 1];
        // Skip fill bytes.
        if (marker == 0xFF) {
            ++i;
            continue;
        }
        // EOI or SOS ends the searchable header section.
        if (marker == 0xD9 || marker == 0xDA) {
            break;
        }

        const uint16_t seg_len = static_cast<uint16_t>((data[i + 2] << 8) | data[i + 3]);
        if (seg_len < 2 || i + 2 + seg_len > data.size()) {
            break;
        }

        if (is_sof_marker(marker) && seg_len >= 8) {
            JpegInfo info;
            info.height = static_cast<uint16_t>((data[i + 5] << 8) | data[i + 6]);
            info.width = static_cast<uint16_t>((data[i + 7] << 8) | data[i + 8]);
            info.components = data[i + 9];
            info.progressive = is_progressive_sof(marker);
            // Component table: id, HV sampling, quant table; three bytes per component.
            if (info.components == 3 && seg_len >= 8 + 3 * 3) {
                const uint8_t hv1 = data[i + 11];
                const uint8_t hv2 = data[i + 14];
                const uint8_t hv3 = data[i + 17];
                info.is_yuv420 = hv1 == 0x22 && hv2 == 0x11 && hv3 == 0x11;
            }
            return info;
        }

        i += 2 + seg_len;
    }
    return std::nullopt;
}

}  // namespace aviforge
