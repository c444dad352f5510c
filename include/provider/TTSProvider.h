/*
 * TTSProvider.h - Boundary to text-to-speech providers
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_PROVIDER_TTSPROVIDER_H
#define HUSHMARK_PROVIDER_TTSPROVIDER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Provider {

struct ModelInfo {
    std::string id;
    std::string name;
};

// Raw provider output, before anonymization
struct SynthesisResult {
    std::vector<uint8_t> bytes;
    std::string format_hint;    // extension or MIME type the provider claims
};

/**
 * @brief One text-to-speech vendor.
 *
 * Request construction, credentials and transport are the
 * implementation's business. The pipeline only sees SynthesisResult.
 */
class TTSProvider {
public:
    virtual ~TTSProvider() = default;

    virtual std::string name() const = 0;
    virtual std::vector<ModelInfo> listModels() const = 0;

    /**
     * @param model_id Model to use; empty selects the provider's default
     */
    virtual SynthesisResult synthesize(const std::string& text, const std::string& model_id) = 0;

    // Providers that failed to initialise report false and are hidden
    virtual bool isAvailable() const { return true; }
};

} // namespace Provider
} // namespace Hushmark

using Hushmark::Provider::TTSProvider;

#endif // HUSHMARK_PROVIDER_TTSPROVIDER_H
