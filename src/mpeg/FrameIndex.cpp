/*
 * FrameIndex.cpp - Ordered partition of an MPEG stream into frames and regions
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace MPEG {

Frame Frame::fromHeader(const MPEGHeader& header, size_t offset)
{
    Frame f;
    f.offset = offset;
    f.length = header.frameLength();
    f.bitrate = header.bitrate_kbps * 1000;
    f.sample_rate = header.sample_rate;
    f.channel_mode = header.channel_mode;
    f.layer = header.layer;
    f.version = header.version;
    f.padding = header.padding;
    f.crc_protected = header.crc_protected;
    return f;
}

const char *regionKindName(RegionKind kind)
{
    switch (kind) {
        case RegionKind::LeadingTag: return "leadingTag";
        case RegionKind::TrailingTag: return "trailingTag";
        case RegionKind::InfoFramePayload: return "infoFramePayload";
        case RegionKind::UnknownGap: return "unknownGap";
    }
    return "?";
}

void FrameIndex::addFrame(const Frame& frame)
{
    m_entries.emplace_back(frame);
    ++m_frame_count;
}

void FrameIndex::addRegion(const NonFrameRegion& region)
{
    if (region.length == 0) return;

    if (region.kind == RegionKind::UnknownGap && !m_entries.empty()) {
        auto *last = std::get_if<NonFrameRegion>(&m_entries.back());
        if (last && last->kind == RegionKind::UnknownGap && last->end() == region.offset) {
            last->length += region.length;
            return;
        }
    }
    m_entries.emplace_back(region);
}

std::vector<Frame> FrameIndex::frames() const
{
    std::vector<Frame> out;
    out.reserve(m_frame_count);
    for (const auto& entry : m_entries) {
        if (const auto *frame = std::get_if<Frame>(&entry)) {
            out.push_back(*frame);
        }
    }
    return out;
}

std::vector<NonFrameRegion> FrameIndex::regions() const
{
    std::vector<NonFrameRegion> out;
    for (const auto& entry : m_entries) {
        if (const auto *region = std::get_if<NonFrameRegion>(&entry)) {
            out.push_back(*region);
        }
    }
    return out;
}

size_t FrameIndex::entryOffset(const Entry& entry)
{
    return std::visit([](const auto& e) { return e.offset; }, entry);
}

size_t FrameIndex::entryLength(const Entry& entry)
{
    return std::visit([](const auto& e) { return e.length; }, entry);
}

size_t FrameIndex::coveredLength() const
{
    if (m_entries.empty()) return 0;
    return entryOffset(m_entries.back()) + entryLength(m_entries.back());
}

bool FrameIndex::partitions(size_t length) const
{
    size_t expected = 0;
    for (const auto& entry : m_entries) {
        if (entryOffset(entry) != expected || entryLength(entry) == 0) {
            return false;
        }
        expected += entryLength(entry);
    }
    return expected == length;
}

} // namespace MPEG
} // namespace Hushmark
