/*
 * FLACDecoder.h - FLAC decoding through libFLAC++
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CODECS_FLAC_FLACDECODER_H
#define HUSHMARK_CODECS_FLAC_FLACDECODER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Codec {

class FLACDecoder: public FLAC::Decoder::Stream
{
    public:
        FLACDecoder();
        ~FLACDecoder() override;

        /**
         * @brief Decode a complete native FLAC stream held in memory.
         * @throws DecodeError if libFLAC rejects the stream
         */
        PCMStream decode(const uint8_t* data, size_t size);

        static PCMStream decodeBuffer(const std::vector<uint8_t>& data);

    protected:
        ::FLAC__StreamDecoderWriteStatus write_callback(const ::FLAC__Frame *frame, const FLAC__int32 * const buffer[]) override;
        void metadata_callback(const ::FLAC__StreamMetadata *metadata) override;
        void error_callback(::FLAC__StreamDecoderErrorStatus status) override;
        ::FLAC__StreamDecoderReadStatus read_callback(FLAC__byte buffer[], size_t *bytes) override;
        ::FLAC__StreamDecoderSeekStatus seek_callback(FLAC__uint64 absolute_byte_offset) override;
        ::FLAC__StreamDecoderTellStatus tell_callback(FLAC__uint64 *absolute_byte_offset) override;
        ::FLAC__StreamDecoderLengthStatus length_callback(FLAC__uint64 *stream_length) override;
        bool eof_callback() override;

    private:
        FLACDecoder(const FLACDecoder&);
        FLACDecoder &operator=(const FLACDecoder&);

        std::unique_ptr<IOHandler> m_handler;
        PCMStream m_pcm;
        unsigned int m_bits_per_sample = 0;
        bool m_got_stream_info = false;
        std::string m_error;
};

} // namespace Codec
} // namespace Hushmark

#endif // HUSHMARK_CODECS_FLAC_FLACDECODER_H
