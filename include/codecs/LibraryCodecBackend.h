/*
 * LibraryCodecBackend.h - In-process codec backend over the linked codec libraries
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CODECS_LIBRARYCODECBACKEND_H
#define HUSHMARK_CODECS_LIBRARYCODECBACKEND_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Codec {

/**
 * @brief Decodes with libmpg123, libFLAC++, libvorbisfile, libopusfile and
 * the built-in RIFF/WAVE reader; encodes with LAME.
 *
 * AIFF and MP4 have no decoder here and are rejected with DecodeError.
 */
class LibraryCodecBackend : public AudioCodecBackend {
public:
    LibraryCodecBackend() = default;

    PCMStream decodeToPCM(const AudioBuffer& input, Audio::AudioFormat format) const override;
    std::vector<uint8_t> encodeFromPCM(const PCMStream& pcm) const override;
    const char *name() const override { return "library"; }

private:
    static PCMStream decodeOgg(const uint8_t *data, size_t size);
};

} // namespace Codec
} // namespace Hushmark

using Hushmark::Codec::LibraryCodecBackend;

#endif // HUSHMARK_CODECS_LIBRARYCODECBACKEND_H
