/*
 * AudioChunker.cpp - Split long audio into fixed-duration WAV chunks
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Audio {

AudioChunker::AudioChunker(const FormatStandardizer& standardizer)
    : m_standardizer(standardizer)
{
}

size_t AudioChunker::framesPerChunk(unsigned int sample_rate, unsigned int chunk_ms)
{
    uint64_t frames = static_cast<uint64_t>(sample_rate) * chunk_ms / 1000;
    return static_cast<size_t>(std::max<uint64_t>(frames, 1));
}

std::vector<std::vector<uint8_t>> AudioChunker::chunk(const AudioBuffer& input, unsigned int chunk_ms) const
{
    if (chunk_ms == 0) {
        throw std::invalid_argument("chunk duration must be greater than zero");
    }

    PCMStream pcm = m_standardizer.decode(input);

    std::vector<std::vector<uint8_t>> chunks;
    const size_t total = pcm.frames();
    const size_t step = framesPerChunk(pcm.sample_rate, chunk_ms);
    for (size_t first = 0; first < total; first += step) {
        chunks.push_back(Codec::WaveCodec::encode(pcm, first, std::min(step, total - first)));
    }

    Debug::log("standardizer", "AudioChunker::chunk(): ", pcm.durationMs(), "ms in ", chunks.size(),
               " chunk(s) of up to ", chunk_ms, "ms");
    return chunks;
}

} // namespace Audio
} // namespace Hushmark
