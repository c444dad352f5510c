/*
 * FLACDecoder.cpp - FLAC decoding through libFLAC++
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Codec {

FLACDecoder::FLACDecoder() : FLAC::Decoder::Stream()
{
}

FLACDecoder::~FLACDecoder()
{
    finish();
}

PCMStream FLACDecoder::decode(const uint8_t* data, size_t size)
{
    m_handler = std::make_unique<MemoryIOHandler>(data, size, false);
    m_pcm = PCMStream();
    m_got_stream_info = false;
    m_error.clear();

    ::FLAC__StreamDecoderInitStatus status = init();
    if (status != FLAC__STREAM_DECODER_INIT_STATUS_OK) {
        throw DecodeError("FLAC decoder init failed: " + TagLib::String(FLAC__StreamDecoderInitStatusString[status]));
    }

    bool ok = process_until_end_of_stream();
    if (!ok || !m_error.empty()) {
        std::string why = m_error.empty() ? get_state().as_cstring() : m_error;
        finish();
        throw DecodeError("FLAC decode failed: " + why);
    }
    if (!m_got_stream_info || m_pcm.samples.empty()) {
        finish();
        throw DecodeError("FLAC stream holds no audio");
    }
    finish();

    Debug::log("codec", "FLAC: ", m_pcm.channels, "ch ", m_pcm.sample_rate, "Hz ", m_bits_per_sample, "-bit, ",
               m_pcm.frames(), " frames");
    return std::move(m_pcm);
}

PCMStream FLACDecoder::decodeBuffer(const std::vector<uint8_t>& data)
{
    FLACDecoder decoder;
    return decoder.decode(data.data(), data.size());
}

::FLAC__StreamDecoderWriteStatus FLACDecoder::write_callback(const ::FLAC__Frame *frame, const FLAC__int32 *const buffer[])
{
    if (!m_got_stream_info || frame->header.channels != m_pcm.channels) {
        m_error = "FLAC frame does not match STREAMINFO";
        return FLAC__STREAM_DECODER_WRITE_STATUS_ABORT;
    }

    // Convert to 16-bit, interleaved
    for (unsigned i = 0; i < frame->header.blocksize; ++i) {
        for (unsigned channel = 0; channel < frame->header.channels; ++channel) {
            int32_t sample = buffer[channel][i];

            if (m_bits_per_sample > 16) {
                sample >>= (m_bits_per_sample - 16);
            } else if (m_bits_per_sample < 16) {
                sample *= 1 << (16 - m_bits_per_sample);
            }

            sample = std::clamp(sample, -32768, 32767);
            m_pcm.samples.push_back(static_cast<int16_t>(sample));
        }
    }
    return FLAC__STREAM_DECODER_WRITE_STATUS_CONTINUE;
}

void FLACDecoder::metadata_callback(const ::FLAC__StreamMetadata *metadata)
{
    if (metadata->type == FLAC__METADATA_TYPE_STREAMINFO) {
        const auto& info = metadata->data.stream_info;
        m_pcm.sample_rate = info.sample_rate;
        m_pcm.channels = info.channels;
        m_pcm.bits_per_sample = 16;
        m_bits_per_sample = info.bits_per_sample;
        if (info.total_samples > 0) {
            m_pcm.samples.reserve(static_cast<size_t>(info.total_samples) * info.channels);
        }
        m_got_stream_info = true;
    }
}

void FLACDecoder::error_callback(::FLAC__StreamDecoderErrorStatus status)
{
    m_error = FLAC__StreamDecoderErrorStatusString[status];
}

::FLAC__StreamDecoderReadStatus FLACDecoder::read_callback(FLAC__byte buffer[], size_t *bytes)
{
    if (*bytes > 0) {
        *bytes = m_handler->read(buffer, sizeof(FLAC__byte), *bytes);
        if (m_handler->getLastError() != 0)
            return FLAC__STREAM_DECODER_READ_STATUS_ABORT;
        if (*bytes == 0)
            return FLAC__STREAM_DECODER_READ_STATUS_END_OF_STREAM;
        return FLAC__STREAM_DECODER_READ_STATUS_CONTINUE;
    }
    return FLAC__STREAM_DECODER_READ_STATUS_ABORT;
}

::FLAC__StreamDecoderSeekStatus FLACDecoder::seek_callback(FLAC__uint64 absolute_byte_offset)
{
    if (m_handler->seek(static_cast<off_t>(absolute_byte_offset), SEEK_SET) != 0)
        return FLAC__STREAM_DECODER_SEEK_STATUS_ERROR;
    return FLAC__STREAM_DECODER_SEEK_STATUS_OK;
}

::FLAC__StreamDecoderTellStatus FLACDecoder::tell_callback(FLAC__uint64 *absolute_byte_offset)
{
    off_t pos = m_handler->tell();
    if (pos < 0)
        return FLAC__STREAM_DECODER_TELL_STATUS_ERROR;
    *absolute_byte_offset = static_cast<FLAC__uint64>(pos);
    return FLAC__STREAM_DECODER_TELL_STATUS_OK;
}

::FLAC__StreamDecoderLengthStatus FLACDecoder::length_callback(FLAC__uint64 *stream_length)
{
    off_t size = m_handler->getFileSize();
    if (size < 0)
        return FLAC__STREAM_DECODER_LENGTH_STATUS_ERROR;
    *stream_length = static_cast<FLAC__uint64>(size);
    return FLAC__STREAM_DECODER_LENGTH_STATUS_OK;
}

bool FLACDecoder::eof_callback()
{
    return m_handler->eof();
}

} // namespace Codec
} // namespace Hushmark
