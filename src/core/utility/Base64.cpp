/*
 * Base64.cpp - Base64 encoding/decoding utility
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */


#include "hushmark.h"


namespace Hushmark {
namespace Core {
namespace Utility {

static const char s_alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// -1 = invalid, -2 = padding, -3 = whitespace
static int decodeChar(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    if (c == '=') return -2;
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') return -3;
    return -1;
}

std::string Base64::encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) |
                          static_cast<uint32_t>(data[i + 2]);
        out.push_back(s_alphabet[(triple >> 18) & 0x3F]);
        out.push_back(s_alphabet[(triple >> 12) & 0x3F]);
        out.push_back(s_alphabet[(triple >> 6) & 0x3F]);
        out.push_back(s_alphabet[triple & 0x3F]);
    }

    size_t remaining = data.size() - i;
    if (remaining == 1) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        out.push_back(s_alphabet[(triple >> 18) & 0x3F]);
        out.push_back(s_alphabet[(triple >> 12) & 0x3F]);
        out.append("==");
    } else if (remaining == 2) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8);
        out.push_back(s_alphabet[(triple >> 18) & 0x3F]);
        out.push_back(s_alphabet[(triple >> 12) & 0x3F]);
        out.push_back(s_alphabet[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

std::optional<std::vector<uint8_t>> Base64::decode(const std::string& input) {
    std::vector<uint8_t> out;
    out.reserve((input.size() / 4) * 3);

    uint32_t accumulator = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (unsigned char c : input) {
        int value = decodeChar(c);
        if (value == -3) {
            continue;
        }
        if (value == -1) {
            return std::nullopt;
        }
        if (value == -2) {
            ++padding;
            continue;
        }
        if (padding > 0) {
            // Data after padding
            return std::nullopt;
        }

        accumulator = (accumulator << 6) | static_cast<uint32_t>(value);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFF));
        }
    }

    // A single dangling symbol can never encode a byte.
    if (symbols % 4 == 1) {
        return std::nullopt;
    }
    if (padding > 0 && ((symbols + padding) % 4 != 0 || padding > 2)) {
        return std::nullopt;
    }

    return out;
}

} // namespace Utility
} // namespace Core
} // namespace Hushmark
