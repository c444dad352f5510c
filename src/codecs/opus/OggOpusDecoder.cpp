/*
 * OggOpusDecoder.cpp - Ogg Opus decoding through libopusfile
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Codec {

namespace {

struct OggOpusFileDeleter {
    void operator()(OggOpusFile *of) const { op_free(of); }
};

} // namespace

bool OggOpusDecoder::isOpus(const uint8_t* data, size_t size)
{
    return size >= 36 && std::memcmp(data, "OggS", 4) == 0 && std::memcmp(data + 28, "OpusHead", 8) == 0;
}

PCMStream OggOpusDecoder::decode(const uint8_t* data, size_t size)
{
    int err = 0;
    std::unique_ptr<OggOpusFile, OggOpusFileDeleter> of(op_open_memory(data, size, &err));
    if (!of) {
        throw DecodeError("op_open_memory() failed, error code: " + std::to_string(err));
    }

    int channels = op_channel_count(of.get(), -1);
    if (channels < 1) {
        throw DecodeError("Opus stream has no channels");
    }

    PCMStream pcm;
    pcm.sample_rate = OUTPUT_RATE;
    pcm.channels = static_cast<unsigned int>(channels);
    pcm.bits_per_sample = 16;

    // 120 ms at 48 kHz is the largest Opus packet
    std::vector<opus_int16> buf(5760 * static_cast<size_t>(channels));
    for (;;) {
        int li = 0;
        int frames = op_read(of.get(), buf.data(), static_cast<int>(buf.size()), &li);
        if (frames == OP_HOLE) {
            continue;
        }
        if (frames < 0) {
            throw DecodeError("op_read() failed, error code: " + std::to_string(frames));
        }
        if (frames == 0) {
            break;
        }
        if (op_channel_count(of.get(), li) != channels) {
            throw DecodeError("Chained Opus stream changes channel count");
        }
        pcm.samples.insert(pcm.samples.end(), buf.begin(), buf.begin() + static_cast<size_t>(frames) * channels);
    }

    if (pcm.samples.empty()) {
        throw DecodeError("Opus stream decoded to no samples");
    }
    Debug::log("codec", "opusfile: ", channels, "ch, ", pcm.frames(), " frames");
    return pcm;
}

} // namespace Codec
} // namespace Hushmark
