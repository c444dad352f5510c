/*
 * FormatStandardizer.h - Decode anything, re-encode to the one output profile
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_PIPELINE_FORMATSTANDARDIZER_H
#define HUSHMARK_PIPELINE_FORMATSTANDARDIZER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Pipeline {

/**
 * @brief Turns an input container into mono 44100 Hz 128 kbps CBR MP3
 * with no tags.
 *
 * Nothing of the input container survives: only samples cross from
 * decode() to encode(). Codec calls run on the worker pool with a
 * per-call timeout.
 */
class FormatStandardizer {
public:
    FormatStandardizer(std::shared_ptr<const AudioCodecBackend> backend,
                       std::shared_ptr<CodecWorkerPool> pool,
                       ConditioningOptions options,
                       std::chrono::milliseconds timeout);

    /**
     * @brief Decode @p input to PCM.
     *
     * The format hint is tried first. If that fails, or the hint names
     * nothing known, the container sniffed from the bytes is used.
     *
     * @throws DecodeError if neither format decodes
     * @throws TimeoutError if the codec call exceeds the timeout
     */
    PCMStream decode(const AudioBuffer& input) const;

    /**
     * @brief Condition @p pcm (mono, 44100 Hz, high-pass, normalize) and
     * encode it to MP3.
     * @throws EncodeError if conditioning or encoding fails
     * @throws TimeoutError if the codec call exceeds the timeout
     */
    std::vector<uint8_t> encode(const PCMStream& pcm) const;

    std::vector<uint8_t> standardize(const AudioBuffer& input) const;

    const AudioCodecBackend& backend() const { return *m_backend; }
    std::chrono::milliseconds timeout() const { return m_timeout; }

private:
    PCMStream decodeAs(const AudioBuffer& input, AudioFormat format) const;

    std::shared_ptr<const AudioCodecBackend> m_backend;
    std::shared_ptr<CodecWorkerPool> m_pool;
    PCMConditioner m_conditioner;
    std::chrono::milliseconds m_timeout;
};

} // namespace Pipeline
} // namespace Hushmark

using Hushmark::Pipeline::FormatStandardizer;

#endif // HUSHMARK_PIPELINE_FORMATSTANDARDIZER_H
