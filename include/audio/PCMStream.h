/*
 * PCMStream.h - Decoded sample buffer
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_AUDIO_PCMSTREAM_H
#define HUSHMARK_AUDIO_PCMSTREAM_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Audio {

// Interleaved signed 16-bit samples. Every decoder converts to this.
struct PCMStream {
    std::vector<int16_t> samples;
    unsigned int sample_rate = 0;
    unsigned int channels = 0;
    unsigned int bits_per_sample = 16;

    // Samples per channel
    size_t frames() const { return channels ? samples.size() / channels : 0; }

    uint64_t durationMs() const {
        return sample_rate ? (static_cast<uint64_t>(frames()) * 1000) / sample_rate : 0;
    }

    bool empty() const { return samples.empty(); }
};

} // namespace Audio
} // namespace Hushmark

using Hushmark::Audio::PCMStream;

#endif // HUSHMARK_AUDIO_PCMSTREAM_H
