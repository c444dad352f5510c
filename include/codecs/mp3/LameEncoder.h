/*
 * LameEncoder.h - Canonical-profile MP3 encoding through LAME
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CODECS_MP3_LAMEENCODER_H
#define HUSHMARK_CODECS_MP3_LAMEENCODER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Codec {

/**
 * @brief Encodes mono 44100 Hz PCM as 128 kbps CBR MPEG-1 Layer III.
 *
 * No ID3v1, ID3v2 or Xing/Info/LAME header frame is written: the output
 * is bare audio frames only.
 */
class LameEncoder {
public:
    LameEncoder();
    ~LameEncoder();

    /**
     * @throws EncodeError if @p pcm is not mono at EncoderProfile::SAMPLE_RATE
     * or if LAME reports an error
     */
    std::vector<uint8_t> encode(const PCMStream& pcm);

    static std::vector<uint8_t> encodeBuffer(const PCMStream& pcm);

private:
    LameEncoder(const LameEncoder&);
    LameEncoder &operator=(const LameEncoder&);

    void configure();

    lame_global_flags *m_gfp;
};

} // namespace Codec
} // namespace Hushmark

#endif // HUSHMARK_CODECS_MP3_LAMEENCODER_H
