/*
 * SynthesisService.cpp - Provider call plus one pipeline pass
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Provider {

SynthesisService::SynthesisService(const ProviderRegistry& registry, const PipelineOrchestrator& pipeline)
    : m_registry(registry), m_pipeline(pipeline)
{
}

SynthesisResponse SynthesisService::synthesize(const std::string& provider_id, const std::string& text,
                                               const std::string& model_id) const
{
    std::shared_ptr<TTSProvider> provider = m_registry.get(provider_id);

    Debug::log("provider", "synthesize(): ", provider->name(), ", model '", model_id, "', ",
               text.size(), " chars");
    SynthesisResult raw = provider->synthesize(text, model_id);

    std::optional<std::string> hint;
    if (!raw.format_hint.empty()) {
        hint = raw.format_hint;
    }
    std::vector<uint8_t> clean = m_pipeline.process(raw.bytes, hint);

    SynthesisResponse response;
    response.audio_base64 = Core::Utility::Base64::encode(clean);
    response.extension = PipelineOrchestrator::outputExtension();
    return response;
}

} // namespace Provider
} // namespace Hushmark
