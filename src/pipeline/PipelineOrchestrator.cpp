/*
 * PipelineOrchestrator.cpp - Standardize, parse and sanitize in one call
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Pipeline {

static ConditioningOptions conditioningFrom(const Config& config)
{
    ConditioningOptions options;
    options.target_rate = Codec::EncoderProfile::SAMPLE_RATE;
    options.normalize = config.normalize;
    options.highpass_hz = config.highpass_hz;
    return options;
}

std::shared_ptr<const AudioCodecBackend> PipelineOrchestrator::makeBackend(const Config& config)
{
    switch (config.codec_backend) {
    case CodecBackendKind::Subprocess:
        return std::make_shared<SubprocessCodecBackend>(config.ffmpeg_path,
                                                        std::chrono::milliseconds(config.codec_timeout_ms));
    case CodecBackendKind::Library:
        break;
    }
    return std::make_shared<LibraryCodecBackend>();
}

PipelineOrchestrator::PipelineOrchestrator(std::shared_ptr<FormatStandardizer> standardizer,
                                           Sanitizer::SignatureSanitizer sanitizer)
    : m_standardizer(std::move(standardizer)), m_sanitizer(std::move(sanitizer))
{
    if (!m_standardizer) {
        throw std::invalid_argument("PipelineOrchestrator needs a FormatStandardizer");
    }
}

PipelineOrchestrator::PipelineOrchestrator(const Config& config)
    : PipelineOrchestrator(
          std::make_shared<FormatStandardizer>(
              makeBackend(config),
              std::make_shared<CodecWorkerPool>(config.worker_threads, config.worker_queue_depth),
              conditioningFrom(config),
              std::chrono::milliseconds(config.codec_timeout_ms)),
          Sanitizer::SignatureSanitizer(config.literal_check, config.extra_tokens))
{
    Debug::log("pipeline", "PipelineOrchestrator: ", codecBackendName(config.codec_backend), " backend, ",
               config.worker_threads, " workers, queue depth ", config.worker_queue_depth,
               ", timeout ", config.codec_timeout_ms, "ms");
}

std::vector<uint8_t> PipelineOrchestrator::process(const std::vector<uint8_t>& raw,
                                                   const std::optional<std::string>& format_hint) const
{
    auto start = std::chrono::steady_clock::now();
    try {
        AudioBuffer input(raw, format_hint);
        std::vector<uint8_t> standardized = m_standardizer->standardize(input);

        MPEG::FrameIndex index = m_parser.parse(standardized);

        Sanitizer::SanitizeReport report;
        std::vector<uint8_t> sanitized = m_sanitizer.sanitize(standardized, index, report);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        Debug::log("pipeline", "process(): ", raw.size(), " bytes in, ", sanitized.size(), " bytes out, ",
                   index.frameCount(), " frames, ", report.regions, " regions, ", report.total(),
                   " bytes neutralized (structural ", report.structural_bytes, ", text ", report.text_bytes,
                   ", literal ", report.literal_bytes, ") in ", elapsed.count(), "ms");
        return sanitized;
    } catch (const StageException& e) {
        Debug::log("pipeline", "process(): aborted with ", Core::errorKindName(e.kind()), ": ", e.what());
        throw PipelineError(e.kind(), e.what());
    }
}

std::string PipelineOrchestrator::processTransport(const std::string& encoded,
                                                   const std::optional<std::string>& format_hint) const
{
    std::optional<std::vector<uint8_t>> raw = Core::Utility::Base64::decode(encoded);
    if (!raw) {
        Debug::log("pipeline", "processTransport(): rejecting malformed base64 (", encoded.size(), " chars)");
        throw PipelineError(ErrorKind::Transport, "transport payload is not valid base64");
    }
    return Core::Utility::Base64::encode(process(*raw, format_hint));
}

} // namespace Pipeline
} // namespace Hushmark
