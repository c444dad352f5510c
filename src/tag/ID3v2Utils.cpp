/*
 * ID3v2Utils.cpp - ID3v2 header layout helpers
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FINAL_BUILD
#include "hushmark.h"
#endif // !FINAL_BUILD

namespace Hushmark {
namespace Tag {
namespace ID3v2Utils {

// ============================================================================
// Synchsafe Integer Functions
// ============================================================================

uint32_t decodeSynchsafeBytes(const uint8_t* data) {
    if (!data) {
        return 0;
    }
    // Big-endian byte order, 7 bits per byte
    return ((static_cast<uint32_t>(data[0] & 0x7F) << 21) |
            (static_cast<uint32_t>(data[1] & 0x7F) << 14) |
            (static_cast<uint32_t>(data[2] & 0x7F) << 7) |
            (static_cast<uint32_t>(data[3] & 0x7F)));
}

void encodeSynchsafeBytes(uint32_t value, uint8_t* out) {
    if (!out) {
        return;
    }
    out[0] = static_cast<uint8_t>((value >> 21) & 0x7F);
    out[1] = static_cast<uint8_t>((value >> 14) & 0x7F);
    out[2] = static_cast<uint8_t>((value >> 7) & 0x7F);
    out[3] = static_cast<uint8_t>(value & 0x7F);
}

// ============================================================================
// Header Recognition
// ============================================================================

static bool hasHeaderLayout(const uint8_t* data, size_t size, const char* magic) {
    if (!data || size < HEADER_SIZE) {
        return false;
    }
    if (std::memcmp(data, magic, 3) != 0) {
        return false;
    }

    // Support 2.2, 2.3, 2.4
    uint8_t major_version = data[3];
    if (major_version < 2 || major_version > 4) {
        return false;
    }
    if (data[4] == 0xFF) {
        return false;
    }

    // Synchsafe size bytes never have the high bit set
    for (int i = 6; i < 10; ++i) {
        if (data[i] & 0x80) {
            return false;
        }
    }
    return true;
}

bool isHeader(const uint8_t* data, size_t size) {
    return hasHeaderLayout(data, size, "ID3");
}

bool isFooter(const uint8_t* data, size_t size) {
    // Footers only exist from 2.4 on
    return hasHeaderLayout(data, size, "3DI") && data[3] == 4;
}

size_t totalTagSize(const uint8_t* header) {
    size_t total = HEADER_SIZE + decodeSynchsafeBytes(header + 6);
    if (header[5] & FLAG_FOOTER_PRESENT) {
        total += FOOTER_SIZE;
    }
    return total;
}

static inline bool isFrameIdChar(uint8_t c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool isFrameHeader(const uint8_t* data, size_t size) {
    if (!data || size < FRAME_HEADER_SIZE) {
        return false;
    }
    for (int i = 0; i < 4; ++i) {
        if (!isFrameIdChar(data[i])) {
            return false;
        }
    }
    // Frame ids always start with a letter
    return data[0] >= 'A' && data[0] <= 'Z';
}

} // namespace ID3v2Utils
} // namespace Tag
} // namespace Hushmark
