/*
 * AudioBuffer.h - Immutable request-scoped audio payload
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_AUDIO_AUDIOBUFFER_H
#define HUSHMARK_AUDIO_AUDIOBUFFER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Audio {

/**
 * @brief Raw audio bytes plus the format the caller claims they are in.
 *
 * The bytes are held through a shared pointer to const, so copies are
 * cheap and a copy handed to a worker thread can never observe a change.
 */
class AudioBuffer {
public:
    explicit AudioBuffer(std::vector<uint8_t> bytes, std::optional<std::string> format_hint = std::nullopt);

    const std::vector<uint8_t>& bytes() const { return *m_bytes; }
    const uint8_t *data() const { return m_bytes->data(); }
    size_t size() const { return m_bytes->size(); }
    bool empty() const { return m_bytes->empty(); }

    const std::optional<std::string>& formatHint() const { return m_format_hint; }

private:
    std::shared_ptr<const std::vector<uint8_t>> m_bytes;
    std::optional<std::string> m_format_hint;
};

} // namespace Audio
} // namespace Hushmark

using Hushmark::Audio::AudioBuffer;

#endif // HUSHMARK_AUDIO_AUDIOBUFFER_H
