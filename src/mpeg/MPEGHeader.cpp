/*
 * MPEGHeader.cpp - MPEG-1/2/2.5 audio frame header decoding
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace MPEG {

// kbit/s, indexed [table][bitrate_index]; index 0 (free) and 15 are invalid
static const unsigned int s_bitrates[5][16] = {
    // MPEG-1 Layer I
    {0, 32, 64, 96, 128, 160, 192, 224, 256, 288, 320, 352, 384, 416, 448, 0},
    // MPEG-1 Layer II
    {0, 32, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 384, 0},
    // MPEG-1 Layer III
    {0, 32, 40, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 0},
    // MPEG-2/2.5 Layer I
    {0, 32, 48, 56, 64, 80, 96, 112, 128, 144, 160, 176, 192, 224, 256, 0},
    // MPEG-2/2.5 Layer II and III
    {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160, 0},
};

static const unsigned int s_sample_rates[3][3] = {
    {44100, 48000, 32000}, // MPEG-1
    {22050, 24000, 16000}, // MPEG-2
    {11025, 12000, 8000},  // MPEG-2.5
};

std::optional<MPEGHeader> MPEGHeader::parse(const uint8_t* data, size_t size)
{
    if (!data || size < HEADER_SIZE) return std::nullopt;

    // 11-bit frame sync
    if (data[0] != 0xFF || (data[1] & 0xE0) != 0xE0) return std::nullopt;

    unsigned int version_bits = (data[1] >> 3) & 0x03;
    unsigned int layer_bits = (data[1] >> 1) & 0x03;
    unsigned int bitrate_index = (data[2] >> 4) & 0x0F;
    unsigned int rate_index = (data[2] >> 2) & 0x03;
    unsigned int emphasis = data[3] & 0x03;

    if (version_bits == 0x01) return std::nullopt;  // reserved
    if (layer_bits == 0x00) return std::nullopt;    // reserved
    if (bitrate_index == 0x00 || bitrate_index == 0x0F) return std::nullopt;
    if (rate_index == 0x03) return std::nullopt;
    if (emphasis == 0x02) return std::nullopt;

    MPEGHeader h;
    switch (version_bits) {
        case 0x03: h.version = MPEGVersion::MPEG1; break;
        case 0x02: h.version = MPEGVersion::MPEG2; break;
        default:   h.version = MPEGVersion::MPEG25; break;
    }
    h.layer = 4 - layer_bits;
    h.crc_protected = (data[1] & 0x01) == 0;
    h.padding = (data[2] & 0x02) != 0;
    h.channel_mode = static_cast<ChannelMode>((data[3] >> 6) & 0x03);
    h.emphasis = emphasis;

    int table;
    if (h.version == MPEGVersion::MPEG1) {
        table = static_cast<int>(h.layer) - 1;
    } else {
        table = h.layer == 1 ? 3 : 4;
    }
    h.bitrate_kbps = s_bitrates[table][bitrate_index];
    h.sample_rate = s_sample_rates[static_cast<int>(h.version)][rate_index];

    // Layer II forbids some bitrate/mode pairs in MPEG-1
    if (h.version == MPEGVersion::MPEG1 && h.layer == 2) {
        bool mono = h.channel_mode == ChannelMode::Mono;
        unsigned int br = h.bitrate_kbps;
        if (mono && br >= 224) return std::nullopt;
        if (!mono && (br == 32 || br == 48 || br == 56 || br == 80)) return std::nullopt;
    }

    return h;
}

size_t MPEGHeader::frameLength() const
{
    const unsigned long bitrate = static_cast<unsigned long>(bitrate_kbps) * 1000;
    const unsigned int pad = padding ? 1 : 0;

    if (layer == 1) {
        return (12 * bitrate / sample_rate + pad) * 4;
    }
    if (layer == 3 && version != MPEGVersion::MPEG1) {
        return 72 * bitrate / sample_rate + pad;
    }
    return 144 * bitrate / sample_rate + pad;
}

unsigned int MPEGHeader::samplesPerFrame() const
{
    if (layer == 1) return 384;
    if (layer == 3 && version != MPEGVersion::MPEG1) return 576;
    return 1152;
}

size_t MPEGHeader::sideInfoSize() const
{
    if (layer != 3) return 0;
    bool mono = channel_mode == ChannelMode::Mono;
    if (version == MPEGVersion::MPEG1) {
        return mono ? 17 : 32;
    }
    return mono ? 9 : 17;
}

const char *versionName(MPEGVersion version)
{
    switch (version) {
        case MPEGVersion::MPEG1: return "MPEG-1";
        case MPEGVersion::MPEG2: return "MPEG-2";
        case MPEGVersion::MPEG25: return "MPEG-2.5";
    }
    return "?";
}

const char *channelModeName(ChannelMode mode)
{
    switch (mode) {
        case ChannelMode::Stereo: return "stereo";
        case ChannelMode::JointStereo: return "joint stereo";
        case ChannelMode::DualChannel: return "dual channel";
        case ChannelMode::Mono: return "mono";
    }
    return "?";
}

} // namespace MPEG
} // namespace Hushmark
