/*
 * FormatStandardizer.cpp - Decode anything, re-encode to the one output profile
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Pipeline {

FormatStandardizer::FormatStandardizer(std::shared_ptr<const AudioCodecBackend> backend,
                                       std::shared_ptr<CodecWorkerPool> pool,
                                       ConditioningOptions options,
                                       std::chrono::milliseconds timeout)
    : m_backend(std::move(backend)), m_pool(std::move(pool)), m_conditioner(options), m_timeout(timeout)
{
    if (!m_backend || !m_pool) {
        throw std::invalid_argument("FormatStandardizer needs a codec backend and a worker pool");
    }
    // The encoder only takes one rate
    if (options.target_rate != Codec::EncoderProfile::SAMPLE_RATE) {
        throw std::invalid_argument("conditioning target rate must be " +
                                    std::to_string(Codec::EncoderProfile::SAMPLE_RATE));
    }
}

PCMStream FormatStandardizer::decodeAs(const AudioBuffer& input, AudioFormat format) const
{
    std::shared_ptr<const AudioCodecBackend> backend = m_backend;
    return m_pool->run<PCMStream>(
        [backend, input, format]() { return backend->decodeToPCM(input, format); },
        m_timeout, ErrorKind::Decode, std::string("decode as ") + FormatDetector::name(format));
}

PCMStream FormatStandardizer::decode(const AudioBuffer& input) const
{
    const AudioFormat sniffed = FormatDetector::sniff(input.bytes());

    if (input.formatHint()) {
        const AudioFormat hinted = FormatDetector::fromHint(*input.formatHint());
        if (hinted == AudioFormat::Unknown) {
            Debug::log("standardizer", "FormatStandardizer::decode(): ignoring unknown format hint '",
                       *input.formatHint(), "'");
        } else {
            try {
                return decodeAs(input, hinted);
            } catch (const DecodeError& e) {
                if (hinted == sniffed) {
                    throw;
                }
                Debug::log("standardizer", "WARNING: decode with hinted format ", FormatDetector::name(hinted),
                           " failed (", e.what(), "), retrying as ", FormatDetector::name(sniffed));
            }
        }
    }

    return decodeAs(input, sniffed);
}

std::vector<uint8_t> FormatStandardizer::encode(const PCMStream& pcm) const
{
    PCMStream conditioned;
    try {
        conditioned = m_conditioner.condition(pcm);
    } catch (const std::invalid_argument& e) {
        throw EncodeError(TagLib::String("cannot condition PCM: ") + e.what());
    }
    if (conditioned.empty()) {
        throw EncodeError("no samples to encode");
    }

    Debug::log("standardizer", "FormatStandardizer::encode(): ", pcm.channels, "ch ", pcm.sample_rate,
               "Hz -> ", conditioned.channels, "ch ", conditioned.sample_rate, "Hz, ",
               conditioned.durationMs(), "ms");

    std::shared_ptr<const AudioCodecBackend> backend = m_backend;
    return m_pool->run<std::vector<uint8_t>>(
        [backend, conditioned]() { return backend->encodeFromPCM(conditioned); },
        m_timeout, ErrorKind::Encode, "encode");
}

std::vector<uint8_t> FormatStandardizer::standardize(const AudioBuffer& input) const
{
    PCMStream pcm = decode(input);
    Debug::log("standardizer", "FormatStandardizer::standardize(): decoded ", input.size(), " bytes to ",
               pcm.frames(), " frames via ", m_backend->name());
    return encode(pcm);
}

} // namespace Pipeline
} // namespace Hushmark
