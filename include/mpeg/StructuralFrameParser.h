/*
 * StructuralFrameParser.h - Splits an MPEG audio stream into frames and non-frame regions
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_MPEG_STRUCTURALFRAMEPARSER_H
#define HUSHMARK_MPEG_STRUCTURALFRAMEPARSER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace MPEG {

/**
 * @brief Builds a FrameIndex covering every byte of a buffer.
 *
 * A candidate header becomes a Frame only when the jump by its computed
 * length lands on another valid header or on the end of the audio area.
 * Anything else is reported as an unknown gap, one byte at a time, with
 * neighbouring gap bytes merged. Tags at either end and a Xing/Info/VBRI
 * frame are reported as regions rather than frames.
 *
 * Stateless; one instance may be shared by any number of threads.
 */
class StructuralFrameParser {
public:
    /**
     * @throws MalformedStreamError if no audio frame is found
     */
    FrameIndex parse(const std::vector<uint8_t>& bytes) const;
    FrameIndex parse(const uint8_t* data, size_t size) const;

    /**
     * @brief Locate an encoder info tag ("Xing", "Info" or "VBRI") inside
     * a frame that starts at data[0].
     * @return Offset of the tag magic relative to the frame start
     */
    static std::optional<size_t> findInfoTag(const MPEGHeader& header, const uint8_t* data, size_t frame_length);

    static constexpr size_t VBRI_OFFSET = 36;
};

} // namespace MPEG
} // namespace Hushmark

#endif // HUSHMARK_MPEG_STRUCTURALFRAMEPARSER_H
