/*
 * MPEGHeader.h - MPEG-1/2/2.5 audio frame header decoding
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_MPEG_MPEGHEADER_H
#define HUSHMARK_MPEG_MPEGHEADER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace MPEG {

enum class MPEGVersion {
    MPEG1,
    MPEG2,
    MPEG25
};

enum class ChannelMode {
    Stereo,
    JointStereo,
    DualChannel,
    Mono
};

/**
 * @brief One decoded 32-bit MPEG audio frame header.
 *
 * Only headers that survive every table check can be constructed through
 * parse(); reserved and free-format values are rejected there.
 */
struct MPEGHeader {
    static constexpr size_t HEADER_SIZE = 4;
    static constexpr size_t CRC_SIZE = 2;

    MPEGVersion version = MPEGVersion::MPEG1;
    unsigned int layer = 3;
    bool crc_protected = false;
    unsigned int bitrate_kbps = 0;
    unsigned int sample_rate = 0;
    bool padding = false;
    ChannelMode channel_mode = ChannelMode::Stereo;
    unsigned int emphasis = 0;

    /**
     * @brief Decode a header at data[0..3].
     * @return std::nullopt unless the sync word and every field are valid
     */
    static std::optional<MPEGHeader> parse(const uint8_t* data, size_t size);

    // Bytes from this header to the next one
    size_t frameLength() const;

    unsigned int samplesPerFrame() const;

    // Layer III side information size, 0 for the other layers
    size_t sideInfoSize() const;

    // Header plus CRC word when present
    size_t headerSize() const { return HEADER_SIZE + (crc_protected ? CRC_SIZE : 0); }

    unsigned int channels() const { return channel_mode == ChannelMode::Mono ? 1 : 2; }
};

const char *versionName(MPEGVersion version);
const char *channelModeName(ChannelMode mode);

} // namespace MPEG
} // namespace Hushmark

#endif // HUSHMARK_MPEG_MPEGHEADER_H
