/*
 * ProviderRegistry.cpp - Immutable provider id to provider map
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Provider {

std::string ProviderRegistry::normalizeId(const std::string& id)
{
    std::string lower = id;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

ProviderRegistry::Builder& ProviderRegistry::Builder::add(const std::string& id, std::shared_ptr<TTSProvider> provider)
{
    if (id.empty()) {
        throw std::invalid_argument("provider id must not be empty");
    }
    if (!provider) {
        throw std::invalid_argument("provider '" + id + "' is null");
    }
    std::string key = normalizeId(id);
    if (!m_providers.emplace(key, std::move(provider)).second) {
        throw std::invalid_argument("provider '" + key + "' registered twice");
    }
    return *this;
}

ProviderRegistry ProviderRegistry::Builder::build()
{
    Debug::log("provider", "ProviderRegistry: ", m_providers.size(), " provider(s) registered");
    return ProviderRegistry(std::move(m_providers));
}

ProviderRegistry::ProviderRegistry(std::map<std::string, std::shared_ptr<TTSProvider>> providers)
    : m_providers(std::move(providers))
{
}

std::shared_ptr<TTSProvider> ProviderRegistry::get(const std::string& id) const
{
    auto it = m_providers.find(normalizeId(id));
    if (it == m_providers.end()) {
        throw ProviderNotFoundException("Provider '" + TagLib::String(id, TagLib::String::UTF8) + "' not found");
    }
    return it->second;
}

bool ProviderRegistry::contains(const std::string& id) const
{
    return m_providers.count(normalizeId(id)) > 0;
}

std::vector<std::string> ProviderRegistry::availableIds() const
{
    std::vector<std::string> ids;
    for (const auto& entry : m_providers) {
        if (entry.second->isAvailable()) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

std::vector<ModelInfo> ProviderRegistry::listModels(const std::string& id) const
{
    return get(id)->listModels();
}

} // namespace Provider
} // namespace Hushmark
