/*
 * ID3v2Utils.h - ID3v2 header layout helpers
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_TAG_ID3V2UTILS_H
#define HUSHMARK_TAG_ID3V2UTILS_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Tag {
namespace ID3v2Utils {

constexpr size_t HEADER_SIZE = 10;
constexpr size_t FOOTER_SIZE = 10;
constexpr uint8_t FLAG_FOOTER_PRESENT = 0x10;

// ============================================================================
// Synchsafe Integer Functions
// ============================================================================

/**
 * @brief Decode synchsafe integer from raw bytes
 * 
 * @param data Pointer to 4 bytes of synchsafe data
 * @return Decoded value (28-bit)
 */
uint32_t decodeSynchsafeBytes(const uint8_t* data);

/**
 * @brief Encode synchsafe integer to raw bytes
 * 
 * @param value Value to encode (must be <= 0x0FFFFFFF)
 * @param out Output buffer (must be at least 4 bytes)
 */
void encodeSynchsafeBytes(uint32_t value, uint8_t* out);

// ============================================================================
// Header Recognition
// ============================================================================

/**
 * @brief Check for a valid ID3v2 header: "ID3", major version 2-4,
 * revision other than 0xFF, and four synchsafe size bytes.
 */
bool isHeader(const uint8_t* data, size_t size);

/**
 * @brief Check for an ID3v2.4 footer: "3DI" with the same layout as the header.
 */
bool isFooter(const uint8_t* data, size_t size);

/**
 * @brief Full size of the tag a header describes: header, body and footer.
 * @param header Pointer to a buffer already accepted by isHeader()
 */
size_t totalTagSize(const uint8_t* header);

/**
 * @brief Check for something shaped like an ID3v2.3/2.4 frame header:
 * four [A-Z0-9] id bytes followed by a size and two flag bytes.
 *
 * The size is not checked against anything; the caller decides what a
 * plausible frame body is.
 */
bool isFrameHeader(const uint8_t* data, size_t size);

constexpr size_t FRAME_HEADER_SIZE = 10;

} // namespace ID3v2Utils
} // namespace Tag
} // namespace Hushmark

#endif // HUSHMARK_TAG_ID3V2UTILS_H
