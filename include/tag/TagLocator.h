/*
 * TagLocator.h - Finds metadata tag blocks around an MPEG audio stream
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_TAG_TAGLOCATOR_H
#define HUSHMARK_TAG_TAGLOCATOR_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Tag {

enum class TagType {
    ID3v1,
    ID3v2,
    APE
};

struct TagSpan {
    TagType type;
    size_t offset;
    size_t length;
};

/**
 * @brief Locates tag blocks by layout alone; never interprets their contents.
 */
class TagLocator {
public:
    static constexpr size_t ID3V1_SIZE = 128;
    static constexpr size_t APE_FOOTER_SIZE = 32;
    static constexpr uint32_t APE_FLAG_HAS_HEADER = 0x80000000u;
    static constexpr uint32_t APE_FLAG_IS_HEADER = 0x20000000u;

    /**
     * @brief ID3v2 tag at offset 0.
     * @return The span clamped to the buffer, or std::nullopt
     */
    static std::optional<TagSpan> findLeading(const uint8_t* data, size_t size);

    /**
     * @brief Walk backwards from EOF collecting ID3v1, APE and appended
     * ID3v2 tags until none matches.
     *
     * @param floor Lowest offset a trailing tag may start at
     * @return Spans in ascending offset order
     */
    static std::vector<TagSpan> findTrailing(const uint8_t* data, size_t size, size_t floor);

    static bool isID3v1(const uint8_t* data, size_t size);

    /**
     * @brief Check for an APE header or footer ("APETAGEX", version 1000 or 2000).
     */
    static bool isAPEHeaderOrFooter(const uint8_t* data, size_t size);

    /**
     * @brief Total APE tag length (items, footer and optional header) as
     * declared by a footer or header block.
     */
    static size_t apeTagLength(const uint8_t* block);
};

} // namespace Tag
} // namespace Hushmark

#endif // HUSHMARK_TAG_TAGLOCATOR_H
