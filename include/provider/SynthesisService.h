/*
 * SynthesisService.h - Provider call plus one pipeline pass
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_PROVIDER_SYNTHESISSERVICE_H
#define HUSHMARK_PROVIDER_SYNTHESISSERVICE_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Provider {

struct SynthesisResponse {
    std::string audio_base64;
    std::string extension;
};

class SynthesisService {
public:
    SynthesisService(const ProviderRegistry& registry, const PipelineOrchestrator& pipeline);

    /**
     * @brief Synthesize with provider @p provider_id and anonymize the
     * result. The extension is always the pipeline's, whatever the
     * provider returned.
     *
     * @throws ProviderNotFoundException for an unknown provider id
     * @throws PipelineError if the provider's audio cannot be processed
     */
    SynthesisResponse synthesize(const std::string& provider_id, const std::string& text,
                                 const std::string& model_id = std::string()) const;

private:
    const ProviderRegistry& m_registry;
    const PipelineOrchestrator& m_pipeline;
};

} // namespace Provider
} // namespace Hushmark

using Hushmark::Provider::SynthesisService;

#endif // HUSHMARK_PROVIDER_SYNTHESISSERVICE_H
