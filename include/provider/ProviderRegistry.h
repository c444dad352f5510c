/*
 * ProviderRegistry.h - Immutable provider id to provider map
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_PROVIDER_PROVIDERREGISTRY_H
#define HUSHMARK_PROVIDER_PROVIDERREGISTRY_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Provider {

/**
 * @brief Providers keyed by lower-cased id. Built once by a Builder and
 * never modified afterwards, so lookups need no locking.
 */
class ProviderRegistry {
public:
    class Builder {
    public:
        /**
         * @throws std::invalid_argument on an empty id, a null provider, or
         * an id (compared case-insensitively) that was already added
         */
        Builder& add(const std::string& id, std::shared_ptr<TTSProvider> provider);

        ProviderRegistry build();

    private:
        std::map<std::string, std::shared_ptr<TTSProvider>> m_providers;
    };

    /**
     * @throws ProviderNotFoundException if @p id was never registered
     */
    std::shared_ptr<TTSProvider> get(const std::string& id) const;

    bool contains(const std::string& id) const;

    // Ids of providers that report themselves available, sorted
    std::vector<std::string> availableIds() const;

    /**
     * @throws ProviderNotFoundException if @p id was never registered
     */
    std::vector<ModelInfo> listModels(const std::string& id) const;

    size_t size() const { return m_providers.size(); }

    static std::string normalizeId(const std::string& id);

private:
    explicit ProviderRegistry(std::map<std::string, std::shared_ptr<TTSProvider>> providers);

    std::map<std::string, std::shared_ptr<TTSProvider>> m_providers;
};

} // namespace Provider
} // namespace Hushmark

using Hushmark::Provider::ProviderRegistry;

#endif // HUSHMARK_PROVIDER_PROVIDERREGISTRY_H
