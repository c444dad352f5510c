/*
 * LibraryCodecBackend.cpp - In-process codec backend over the linked codec libraries
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Codec {

PCMStream LibraryCodecBackend::decodeToPCM(const AudioBuffer& input, Audio::AudioFormat format) const
{
    if (input.empty()) {
        throw DecodeError("empty input buffer");
    }

    Debug::log("codec", "LibraryCodecBackend::decodeToPCM(): decoding ", input.size(),
               " bytes as ", FormatDetector::name(format));

    switch (format) {
    case AudioFormat::WAV:
        return WaveCodec::decode(input.data(), input.size());
    case AudioFormat::MP3:
        return MPG123Decoder::decodeBuffer(input.bytes());
    case AudioFormat::FLAC:
        return FLACDecoder::decodeBuffer(input.bytes());
    case AudioFormat::Ogg:
        return decodeOgg(input.data(), input.size());
    case AudioFormat::AIFF:
    case AudioFormat::MP4:
        throw DecodeError(TagLib::String("no in-process decoder for ") + FormatDetector::name(format));
    case AudioFormat::Unknown:
        break;
    }
    throw DecodeError("unrecognised audio container");
}

PCMStream LibraryCodecBackend::decodeOgg(const uint8_t *data, size_t size)
{
    if (VorbisDecoder::isVorbis(data, size)) {
        VorbisDecoder decoder;
        return decoder.decode(data, size);
    }
    if (OggOpusDecoder::isOpus(data, size)) {
        return OggOpusDecoder::decode(data, size);
    }
    throw DecodeError("Ogg stream carries neither Vorbis nor Opus");
}

std::vector<uint8_t> LibraryCodecBackend::encodeFromPCM(const PCMStream& pcm) const
{
    return LameEncoder::encodeBuffer(pcm);
}

} // namespace Codec
} // namespace Hushmark
