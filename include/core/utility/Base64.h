/*
 * Base64.h - Base64 encoding/decoding utility
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CORE_UTILITY_BASE64_H
#define HUSHMARK_CORE_UTILITY_BASE64_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace Hushmark {
namespace Core {
namespace Utility {

class Base64 {
public:
    /**
     * @brief Decode a Base64 encoded string (RFC 4648 standard alphabet)
     *
     * ASCII whitespace is skipped so line-wrapped input decodes. Padding
     * is optional, but a padded input must be correctly padded.
     *
     * @param input Base64 encoded string
     * @return Decoded binary data, or std::nullopt if the input is malformed
     */
    static std::optional<std::vector<uint8_t>> decode(const std::string& input);

    /**
     * @brief Encode binary data to Base64 string
     * 
     * @param data Binary data to encode
     * @return Base64 encoded string, padded, without line breaks
     */
    static std::string encode(const std::vector<uint8_t>& data);
};

} // namespace Utility
} // namespace Core
} // namespace Hushmark

#endif // HUSHMARK_CORE_UTILITY_BASE64_H
