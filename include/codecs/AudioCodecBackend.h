/*
 * AudioCodecBackend.h - Seam between the standardizer and the codec implementations
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CODECS_AUDIOCODECBACKEND_H
#define HUSHMARK_CODECS_AUDIOCODECBACKEND_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Codec {

// The one MP3 profile every output is encoded to
struct EncoderProfile {
    static constexpr unsigned int SAMPLE_RATE = 44100;
    static constexpr unsigned int CHANNELS = 1;
    static constexpr unsigned int BITRATE_KBPS = 128;
};

/**
 * @brief Decodes containers to PCM and encodes PCM to the canonical MP3
 * profile.
 *
 * Implementations hold no per-request state; both calls may run
 * concurrently from several threads.
 */
class AudioCodecBackend {
public:
    virtual ~AudioCodecBackend() = default;

    /**
     * @brief Decode a complete container to interleaved 16-bit PCM.
     * @param input Bytes to decode
     * @param format Container to decode them as
     * @throws DecodeError if the bytes are not a decodable @p format stream
     * @throws TimeoutError if the codec does not finish in time
     */
    virtual PCMStream decodeToPCM(const AudioBuffer& input, Audio::AudioFormat format) const = 0;

    /**
     * @brief Encode mono 44100 Hz PCM to tagless 128 kbps CBR MP3.
     * @throws EncodeError if the encoder rejects the samples or fails
     * @throws TimeoutError if the codec does not finish in time
     */
    virtual std::vector<uint8_t> encodeFromPCM(const PCMStream& pcm) const = 0;

    virtual const char *name() const = 0;
};

} // namespace Codec
} // namespace Hushmark

using Hushmark::Codec::AudioCodecBackend;

#endif // HUSHMARK_CODECS_AUDIOCODECBACKEND_H
