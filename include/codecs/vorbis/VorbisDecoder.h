/*
 * VorbisDecoder.h - Ogg Vorbis decoding through libvorbisfile
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CODECS_VORBIS_VORBISDECODER_H
#define HUSHMARK_CODECS_VORBIS_VORBISDECODER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Codec {

class VorbisDecoder {
public:
    VorbisDecoder() = default;
    ~VorbisDecoder();

    /**
     * @throws DecodeError if the data is not a decodable Ogg Vorbis stream
     */
    PCMStream decode(const uint8_t* data, size_t size);

    static PCMStream decodeBuffer(const std::vector<uint8_t>& data);

    // True if the first Ogg page carries a Vorbis identification header
    static bool isVorbis(const uint8_t* data, size_t size);

private:
    VorbisDecoder(const VorbisDecoder&);
    VorbisDecoder &operator=(const VorbisDecoder&);

    OggVorbis_File m_vorbis_file;
    bool m_open = false;
    std::unique_ptr<IOHandler> m_handler;
};

} // namespace Codec
} // namespace Hushmark

#endif // HUSHMARK_CODECS_VORBIS_VORBISDECODER_H
