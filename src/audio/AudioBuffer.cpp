/*
 * AudioBuffer.cpp - Immutable request-scoped audio payload
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Audio {

AudioBuffer::AudioBuffer(std::vector<uint8_t> bytes, std::optional<std::string> format_hint)
    : m_bytes(std::make_shared<const std::vector<uint8_t>>(std::move(bytes))),
      m_format_hint(std::move(format_hint))
{
    if (m_format_hint && m_format_hint->empty()) {
        m_format_hint.reset();
    }
}

} // namespace Audio
} // namespace Hushmark
