/*
 * PipelineOrchestrator.h - Standardize, parse and sanitize in one call
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_PIPELINE_PIPELINEORCHESTRATOR_H
#define HUSHMARK_PIPELINE_PIPELINEORCHESTRATOR_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Pipeline {

/**
 * @brief The anonymization pipeline: FormatStandardizer, then
 * StructuralFrameParser, then SignatureSanitizer.
 *
 * Each call works on its own buffers only, so one orchestrator serves
 * any number of concurrent requests. Any stage failure surfaces as a
 * PipelineError carrying that stage's ErrorKind; no partially cleaned
 * output is ever returned.
 */
class PipelineOrchestrator {
public:
    PipelineOrchestrator(std::shared_ptr<FormatStandardizer> standardizer,
                         Sanitizer::SignatureSanitizer sanitizer);

    /**
     * @brief Build the backend, worker pool and stages described by @p config.
     */
    explicit PipelineOrchestrator(const Config& config);

    /**
     * @throws PipelineError with the failing stage's kind
     */
    std::vector<uint8_t> process(const std::vector<uint8_t>& raw,
                                 const std::optional<std::string>& format_hint = std::nullopt) const;

    /**
     * @brief process() over base64 text.
     * @throws PipelineError of kind Transport if @p encoded is not valid base64
     */
    std::string processTransport(const std::string& encoded,
                                 const std::optional<std::string>& format_hint = std::nullopt) const;

    static const char *outputExtension() { return "mp3"; }

    const FormatStandardizer& standardizer() const { return *m_standardizer; }
    const Sanitizer::SignatureSanitizer& sanitizer() const { return m_sanitizer; }

    static std::shared_ptr<const AudioCodecBackend> makeBackend(const Config& config);

private:
    std::shared_ptr<FormatStandardizer> m_standardizer;
    MPEG::StructuralFrameParser m_parser;
    Sanitizer::SignatureSanitizer m_sanitizer;
};

} // namespace Pipeline
} // namespace Hushmark

using Hushmark::Pipeline::PipelineOrchestrator;

#endif // HUSHMARK_PIPELINE_PIPELINEORCHESTRATOR_H
