/*
 * FrameIndex.h - Ordered partition of an MPEG stream into frames and regions
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_MPEG_FRAMEINDEX_H
#define HUSHMARK_MPEG_FRAMEINDEX_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace MPEG {

struct Frame {
    size_t offset = 0;
    size_t length = 0;
    unsigned int bitrate = 0;       // bit/s
    unsigned int sample_rate = 0;
    ChannelMode channel_mode = ChannelMode::Stereo;
    unsigned int layer = 3;
    MPEGVersion version = MPEGVersion::MPEG1;
    bool padding = false;
    bool crc_protected = false;

    static Frame fromHeader(const MPEGHeader& header, size_t offset);
};

enum class RegionKind {
    LeadingTag,
    TrailingTag,
    InfoFramePayload,
    UnknownGap
};

struct NonFrameRegion {
    size_t offset = 0;
    size_t length = 0;
    RegionKind kind = RegionKind::UnknownGap;
    // Leading bytes that must survive sanitization (an info frame's header)
    size_t protected_length = 0;

    size_t end() const { return offset + length; }
    size_t sanitizableOffset() const { return offset + std::min(protected_length, length); }
    size_t sanitizableLength() const { return length - std::min(protected_length, length); }
};

const char *regionKindName(RegionKind kind);

/**
 * @brief Frames and non-frame regions in stream order.
 *
 * Built append-only by StructuralFrameParser. Entries are expected to
 * abut; partitions() checks that they tile a buffer exactly.
 */
class FrameIndex {
public:
    using Entry = std::variant<Frame, NonFrameRegion>;

    void addFrame(const Frame& frame);

    /**
     * @brief Append a region; an unknown gap directly after another unknown
     * gap is merged into it.
     */
    void addRegion(const NonFrameRegion& region);

    const std::vector<Entry>& entries() const { return m_entries; }
    std::vector<Frame> frames() const;
    std::vector<NonFrameRegion> regions() const;

    size_t frameCount() const { return m_frame_count; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    // End offset of the last entry
    size_t coveredLength() const;

    /**
     * @brief True if the entries tile [0, length) with no gap or overlap.
     */
    bool partitions(size_t length) const;

    static size_t entryOffset(const Entry& entry);
    static size_t entryLength(const Entry& entry);

private:
    std::vector<Entry> m_entries;
    size_t m_frame_count = 0;
};

} // namespace MPEG
} // namespace Hushmark

#endif // HUSHMARK_MPEG_FRAMEINDEX_H
