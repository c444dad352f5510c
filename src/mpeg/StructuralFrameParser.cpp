/*
 * StructuralFrameParser.cpp - Splits an MPEG audio stream into frames and non-frame regions
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace MPEG {

std::optional<size_t> StructuralFrameParser::findInfoTag(const MPEGHeader& header, const uint8_t* data,
                                                         size_t frame_length)
{
    if (header.layer != 3) return std::nullopt;

    size_t xing = header.headerSize() + header.sideInfoSize();
    if (xing + 4 <= frame_length &&
        (std::memcmp(data + xing, "Xing", 4) == 0 || std::memcmp(data + xing, "Info", 4) == 0)) {
        return xing;
    }
    if (VBRI_OFFSET + 4 <= frame_length && std::memcmp(data + VBRI_OFFSET, "VBRI", 4) == 0) {
        return VBRI_OFFSET;
    }
    return std::nullopt;
}

FrameIndex StructuralFrameParser::parse(const std::vector<uint8_t>& bytes) const
{
    return parse(bytes.data(), bytes.size());
}

FrameIndex StructuralFrameParser::parse(const uint8_t* data, size_t size) const
{
    FrameIndex index;

    size_t audio_start = 0;
    if (auto leading = Tag::TagLocator::findLeading(data, size)) {
        index.addRegion({0, leading->length, RegionKind::LeadingTag, 0});
        audio_start = leading->length;
    }

    std::vector<Tag::TagSpan> trailing = Tag::TagLocator::findTrailing(data, size, audio_start);
    size_t audio_end = trailing.empty() ? size : trailing.front().offset;

    bool seen_frame = false;
    size_t info_frames = 0;
    size_t gap_bytes = 0;
    size_t pos = audio_start;

    while (pos < audio_end) {
        size_t avail = audio_end - pos;
        auto header = MPEGHeader::parse(data + pos, avail);
        if (header) {
            size_t length = header->frameLength();
            size_t next = pos + length;
            bool confirmed = length > header->headerSize() && length <= avail &&
                (next == audio_end || MPEGHeader::parse(data + next, audio_end - next).has_value());

            if (confirmed) {
                if (!seen_frame && findInfoTag(*header, data + pos, length)) {
                    index.addRegion({pos, length, RegionKind::InfoFramePayload, header->headerSize()});
                    ++info_frames;
                    DEBUG_LOG("parser", "info frame at ", pos, ", ", length, " bytes");
                } else {
                    index.addFrame(Frame::fromHeader(*header, pos));
                }
                seen_frame = true;
                pos = next;
                continue;
            }
        }

        index.addRegion({pos, 1, RegionKind::UnknownGap, 0});
        ++gap_bytes;
        ++pos;
    }

    for (const auto& span : trailing) {
        index.addRegion({span.offset, span.length, RegionKind::TrailingTag, 0});
    }

    DEBUG_LOG("parser", "parsed ", size, " bytes: ", index.frameCount(), " frames, ", info_frames,
              " info frame(s), ", gap_bytes, " gap bytes, ", trailing.size(), " trailing tag(s)");

    if (index.frameCount() == 0) {
        throw MalformedStreamError("No valid MPEG audio frames in " + std::to_string(size) + " byte stream");
    }
    return index;
}

} // namespace MPEG
} // namespace Hushmark
