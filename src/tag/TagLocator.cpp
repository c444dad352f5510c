/*
 * TagLocator.cpp - Finds metadata tag blocks around an MPEG audio stream
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Tag {

using Core::Utility::ByteOrder::readLE32;

std::optional<TagSpan> TagLocator::findLeading(const uint8_t* data, size_t size)
{
    if (!ID3v2Utils::isHeader(data, size)) {
        return std::nullopt;
    }
    size_t length = std::min(ID3v2Utils::totalTagSize(data), size);
    Debug::log("parser", "leading ID3v2.", static_cast<int>(data[3]), " tag, ", length, " bytes");
    return TagSpan{TagType::ID3v2, 0, length};
}

bool TagLocator::isID3v1(const uint8_t* data, size_t size)
{
    return data && size >= ID3V1_SIZE && data[0] == 'T' && data[1] == 'A' && data[2] == 'G';
}

bool TagLocator::isAPEHeaderOrFooter(const uint8_t* data, size_t size)
{
    if (!data || size < APE_FOOTER_SIZE || std::memcmp(data, "APETAGEX", 8) != 0) {
        return false;
    }
    uint32_t version = readLE32(data + 8);
    return version == 1000 || version == 2000;
}

size_t TagLocator::apeTagLength(const uint8_t* block)
{
    // The declared size covers items plus footer, never the header
    size_t length = readLE32(block + 12);
    if (readLE32(block + 20) & APE_FLAG_HAS_HEADER) {
        length += APE_FOOTER_SIZE;
    }
    return length;
}

std::vector<TagSpan> TagLocator::findTrailing(const uint8_t* data, size_t size, size_t floor)
{
    std::vector<TagSpan> spans;
    size_t end = size;

    while (end > floor) {
        size_t avail = end - floor;

        if (avail >= ID3V1_SIZE && isID3v1(data + end - ID3V1_SIZE, ID3V1_SIZE)) {
            end -= ID3V1_SIZE;
            spans.push_back({TagType::ID3v1, end, ID3V1_SIZE});
            continue;
        }

        if (avail >= APE_FOOTER_SIZE) {
            const uint8_t* footer = data + end - APE_FOOTER_SIZE;
            if (isAPEHeaderOrFooter(footer, APE_FOOTER_SIZE) &&
                !(readLE32(footer + 20) & APE_FLAG_IS_HEADER)) {
                size_t length = apeTagLength(footer);
                if (length >= APE_FOOTER_SIZE && length <= avail) {
                    end -= length;
                    spans.push_back({TagType::APE, end, length});
                    continue;
                }
            }
        }

        if (avail >= ID3v2Utils::FOOTER_SIZE) {
            const uint8_t* footer = data + end - ID3v2Utils::FOOTER_SIZE;
            if (ID3v2Utils::isFooter(footer, ID3v2Utils::FOOTER_SIZE)) {
                size_t length = ID3v2Utils::HEADER_SIZE + ID3v2Utils::decodeSynchsafeBytes(footer + 6)
                              + ID3v2Utils::FOOTER_SIZE;
                if (length <= avail && ID3v2Utils::isHeader(data + end - length, length)) {
                    end -= length;
                    spans.push_back({TagType::ID3v2, end, length});
                    continue;
                }
            }
        }

        break;
    }

    std::reverse(spans.begin(), spans.end());
    for (const auto& span : spans) {
        Debug::log("parser", "trailing tag at ", span.offset, ", ", span.length, " bytes");
    }
    return spans;
}

} // namespace Tag
} // namespace Hushmark
