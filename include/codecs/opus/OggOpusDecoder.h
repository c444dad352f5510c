/*
 * OggOpusDecoder.h - Ogg Opus decoding through libopusfile
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CODECS_OPUS_OGGOPUSDECODER_H
#define HUSHMARK_CODECS_OPUS_OGGOPUSDECODER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Codec {

class OggOpusDecoder {
public:
    // libopusfile always decodes at 48 kHz
    static constexpr unsigned int OUTPUT_RATE = 48000;

    /**
     * @throws DecodeError if the data is not a decodable Ogg Opus stream
     */
    static PCMStream decode(const uint8_t* data, size_t size);
    static PCMStream decodeBuffer(const std::vector<uint8_t>& data) { return decode(data.data(), data.size()); }

    // True if the first Ogg page carries an OpusHead packet
    static bool isOpus(const uint8_t* data, size_t size);
};

} // namespace Codec
} // namespace Hushmark

#endif // HUSHMARK_CODECS_OPUS_OGGOPUSDECODER_H
