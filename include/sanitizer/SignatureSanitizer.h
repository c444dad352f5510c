/*
 * SignatureSanitizer.h - Neutralizes identifying bytes outside MPEG audio frames
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_SANITIZER_SIGNATURESANITIZER_H
#define HUSHMARK_SANITIZER_SIGNATURESANITIZER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Sanitizer {

// Bytes neutralized per pass, over all iterations
struct SanitizeReport {
    size_t regions = 0;
    size_t structural_bytes = 0;
    size_t text_bytes = 0;
    size_t literal_bytes = 0;
    size_t literal_hits = 0;
    unsigned int iterations = 0;

    size_t total() const { return structural_bytes + text_bytes + literal_bytes; }
};

/**
 * @brief Overwrites metadata and text signatures with FILLER, touching only
 * the NonFrameRegion spans of a FrameIndex.
 *
 * Per region, in order:
 *  1. structural pass: tag regions and info frame payloads are cleared
 *     whole; inside unknown gaps, ID3v2/APE/ID3v1 blocks, ID3v2 frame
 *     headers and FourCC+length chunks are recognised by layout and cleared.
 *  2. text pass: every run of MIN_TEXT_RUN or more printable ASCII bytes
 *     is cleared.
 *  3. literal check (optional): known tokens that survived are cleared and
 *     reported as a warning.
 * The passes repeat until an iteration changes nothing, so a second
 * sanitize() over the same index is a no-op.
 *
 * The buffer length never changes and frame bytes are never written.
 */
class SignatureSanitizer {
public:
    static constexpr uint8_t FILLER = 0x00;
    static constexpr size_t MIN_TEXT_RUN = 4;

    explicit SignatureSanitizer(bool literal_check = true,
                                const std::vector<std::string>& extra_tokens = std::vector<std::string>());

    /**
     * @throws MalformedStreamError if a region lies outside the buffer
     */
    std::vector<uint8_t> sanitize(const std::vector<uint8_t>& bytes, const MPEG::FrameIndex& index) const;
    std::vector<uint8_t> sanitize(const std::vector<uint8_t>& bytes, const MPEG::FrameIndex& index,
                                  SanitizeReport& report) const;

    SanitizeReport sanitizeInPlace(std::vector<uint8_t>& bytes, const MPEG::FrameIndex& index) const;

    const std::vector<std::string>& tokens() const { return m_tokens; }
    bool literalCheckEnabled() const { return m_literal_check; }

    static const std::vector<std::string>& defaultTokens();

    static inline bool isPrintable(uint8_t c) { return c >= 0x20 && c <= 0x7E; }

private:
    size_t structuralPass(uint8_t* data, const MPEG::NonFrameRegion& region) const;
    size_t structuralGapPass(uint8_t* data, size_t start, size_t end) const;
    size_t textPass(uint8_t* data, size_t start, size_t end) const;
    size_t literalPass(uint8_t* data, size_t start, size_t end, size_t& hits) const;

    static size_t fill(uint8_t* p, size_t n);

    bool m_literal_check;
    std::vector<std::string> m_tokens;
};

} // namespace Sanitizer
} // namespace Hushmark

#endif // HUSHMARK_SANITIZER_SIGNATURESANITIZER_H
