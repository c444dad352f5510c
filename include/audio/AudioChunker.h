/*
 * AudioChunker.h - Split long audio into fixed-duration WAV chunks
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_AUDIO_AUDIOCHUNKER_H
#define HUSHMARK_AUDIO_AUDIOCHUNKER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Audio {

class AudioChunker {
public:
    static constexpr unsigned int DEFAULT_CHUNK_MS = 30000;

    explicit AudioChunker(const FormatStandardizer& standardizer);

    /**
     * @brief Decode @p input and cut it into WAV files of at most
     * @p chunk_ms each, keeping the source rate and channel count.
     *
     * Only the last chunk may be shorter.
     *
     * @throws std::invalid_argument if @p chunk_ms is zero
     * @throws DecodeError if the input does not decode
     */
    std::vector<std::vector<uint8_t>> chunk(const AudioBuffer& input,
                                            unsigned int chunk_ms = DEFAULT_CHUNK_MS) const;

    // Whole frames per chunk at @p sample_rate, never less than one
    static size_t framesPerChunk(unsigned int sample_rate, unsigned int chunk_ms);

private:
    const FormatStandardizer& m_standardizer;
};

} // namespace Audio
} // namespace Hushmark

using Hushmark::Audio::AudioChunker;

#endif // HUSHMARK_AUDIO_AUDIOCHUNKER_H
