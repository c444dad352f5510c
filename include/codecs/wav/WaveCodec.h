/*
 * WaveCodec.h - RIFF WAVE reader and writer
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CODECS_WAV_WAVECODEC_H
#define HUSHMARK_CODECS_WAV_WAVECODEC_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Codec {

class WaveCodec {
public:
    /**
     * @brief Decode an in-memory RIFF WAVE file to 16-bit PCM.
     *
     * Handles LPCM 8/16/24/32-bit, IEEE float 32/64-bit, A-law and mu-law,
     * plain or WAVE_FORMAT_EXTENSIBLE. A leading ID3v2 tag is skipped.
     *
     * @throws DecodeError if the data is not a supported WAVE file
     */
    static PCMStream decode(const uint8_t* data, size_t size);
    static PCMStream decode(const std::vector<uint8_t>& data) { return decode(data.data(), data.size()); }

    /**
     * @brief Write a canonical 44-byte-header 16-bit LPCM WAVE file.
     */
    static std::vector<uint8_t> encode(const PCMStream& pcm);

    // Same, for a frame range of @p pcm
    static std::vector<uint8_t> encode(const PCMStream& pcm, size_t first_frame, size_t frame_count);

private:
    enum class WaveEncoding {
        Unsupported,
        PCM,
        IEEE_FLOAT,
        ALAW,
        MULAW
    };

    static void convertSamples(WaveEncoding encoding, unsigned int bits, const uint8_t* in, size_t count,
                               int16_t* out);
};

} // namespace Codec
} // namespace Hushmark

#endif // HUSHMARK_CODECS_WAV_WAVECODEC_H
