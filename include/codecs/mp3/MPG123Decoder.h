/*
 * MPG123Decoder.h - MPEG audio decoding through libmpg123
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CODECS_MP3_MPG123DECODER_H
#define HUSHMARK_CODECS_MP3_MPG123DECODER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Codec {

/**
 * @brief Decodes an in-memory MPEG audio stream to 16-bit PCM.
 *
 * libmpg123 reads through a MemoryIOHandler installed with
 * mpg123_replace_reader_handle(). One instance decodes one buffer.
 */
class MPG123Decoder {
public:
    MPG123Decoder();
    ~MPG123Decoder();

    /**
     * @throws DecodeError on any libmpg123 failure or if no samples come out
     */
    PCMStream decode(const uint8_t* data, size_t size);

    static PCMStream decodeBuffer(const std::vector<uint8_t>& data);

private:
    MPG123Decoder(const MPG123Decoder&);
    MPG123Decoder &operator=(const MPG123Decoder&);

    mpg123_handle *m_mpg_handle;
    std::unique_ptr<IOHandler> m_handler;
    bool m_open = false;
};

} // namespace Codec
} // namespace Hushmark

#endif // HUSHMARK_CODECS_MP3_MPG123DECODER_H
