/*
 * LameEncoder.cpp - Canonical-profile MP3 encoding through LAME
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Codec {

// Worst case output size documented in lame.h
static inline size_t mp3BufferSize(size_t samples)
{
    return samples + samples / 4 + 7200;
}

static void checkLame(int ret, const char *call)
{
    if (ret < 0) {
        throw EncodeError(TagLib::String(call) + " failed with LAME error " + TagLib::String::number(ret));
    }
}

LameEncoder::LameEncoder() : m_gfp(lame_init())
{
    if (!m_gfp) {
        throw EncodeError("lame_init() failed");
    }
    try {
        configure();
    } catch (...) {
        lame_close(m_gfp);
        throw; // Re-throw the exception after releasing the encoder.
    }
}

LameEncoder::~LameEncoder()
{
    lame_close(m_gfp);
}

void LameEncoder::configure()
{
    checkLame(lame_set_num_channels(m_gfp, EncoderProfile::CHANNELS), "lame_set_num_channels()");
    checkLame(lame_set_in_samplerate(m_gfp, EncoderProfile::SAMPLE_RATE), "lame_set_in_samplerate()");
    checkLame(lame_set_out_samplerate(m_gfp, EncoderProfile::SAMPLE_RATE), "lame_set_out_samplerate()");
    checkLame(lame_set_mode(m_gfp, MONO), "lame_set_mode()");
    checkLame(lame_set_VBR(m_gfp, vbr_off), "lame_set_VBR()");
    checkLame(lame_set_brate(m_gfp, EncoderProfile::BITRATE_KBPS), "lame_set_brate()");
    checkLame(lame_set_quality(m_gfp, 2), "lame_set_quality()");
    // No Xing/Info/LAME header frame
    checkLame(lame_set_bWriteVbrTag(m_gfp, 0), "lame_set_bWriteVbrTag()");
    checkLame(lame_set_original(m_gfp, 0), "lame_set_original()");
    checkLame(lame_set_copyright(m_gfp, 0), "lame_set_copyright()");
    checkLame(lame_set_error_protection(m_gfp, 0), "lame_set_error_protection()");
    checkLame(lame_init_params(m_gfp), "lame_init_params()");
}

std::vector<uint8_t> LameEncoder::encode(const PCMStream& pcm)
{
    if (pcm.channels != EncoderProfile::CHANNELS || pcm.sample_rate != EncoderProfile::SAMPLE_RATE) {
        throw EncodeError("LAME encoder expects mono 44100 Hz PCM, got " + std::to_string(pcm.channels) +
                          "ch " + std::to_string(pcm.sample_rate) + "Hz");
    }

    std::vector<uint8_t> out;
    // Feed in blocks so the output buffer stays bounded
    const size_t block = 1152 * 16;
    std::vector<unsigned char> mp3buf(mp3BufferSize(block));

    // Mono input only reads the left buffer; pass it for both
    std::vector<short> samples(pcm.samples.begin(), pcm.samples.end());
    for (size_t pos = 0; pos < samples.size(); pos += block) {
        int n = static_cast<int>(std::min(block, samples.size() - pos));
        int written = lame_encode_buffer(m_gfp, samples.data() + pos, samples.data() + pos, n,
                                         mp3buf.data(), static_cast<int>(mp3buf.size()));
        checkLame(written, "lame_encode_buffer()");
        out.insert(out.end(), mp3buf.begin(), mp3buf.begin() + written);
    }

    int written = lame_encode_flush(m_gfp, mp3buf.data(), static_cast<int>(mp3buf.size()));
    checkLame(written, "lame_encode_flush()");
    out.insert(out.end(), mp3buf.begin(), mp3buf.begin() + written);

    if (out.empty()) {
        throw EncodeError("LAME produced no output");
    }
    Debug::log("codec", "LAME: ", pcm.frames(), " frames -> ", out.size(), " bytes");
    return out;
}

std::vector<uint8_t> LameEncoder::encodeBuffer(const PCMStream& pcm)
{
    LameEncoder encoder;
    return encoder.encode(pcm);
}

} // namespace Codec
} // namespace Hushmark
