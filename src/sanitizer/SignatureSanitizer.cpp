/*
 * SignatureSanitizer.cpp - Neutralizes identifying bytes outside MPEG audio frames
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Sanitizer {

using MPEG::FrameIndex;
using MPEG::NonFrameRegion;
using MPEG::RegionKind;
using Core::Utility::ByteOrder::readLE32;
using Core::Utility::ByteOrder::readBE32;

// Encoder names, AI-content markers and vendor strings seen in the wild
static const std::vector<std::string> s_default_tokens = {
    "LAME", "Lavf", "Lavc", "Xing", "Info", "VBRI", "ID3", "TAG", "APETAGEX",
    "TSSE", "TXXX", "aigc", "ContentProducer", "HUABABSpeech"
};

const std::vector<std::string>& SignatureSanitizer::defaultTokens()
{
    return s_default_tokens;
}

SignatureSanitizer::SignatureSanitizer(bool literal_check, const std::vector<std::string>& extra_tokens)
    : m_literal_check(literal_check), m_tokens(s_default_tokens)
{
    for (const auto& token : extra_tokens) {
        if (!token.empty() && std::find(m_tokens.begin(), m_tokens.end(), token) == m_tokens.end()) {
            m_tokens.push_back(token);
        }
    }
}

size_t SignatureSanitizer::fill(uint8_t* p, size_t n)
{
    size_t changed = 0;
    for (size_t i = 0; i < n; ++i) {
        if (p[i] != FILLER) {
            p[i] = FILLER;
            ++changed;
        }
    }
    return changed;
}

static inline bool isFourCCChar(uint8_t c)
{
    return SignatureSanitizer::isPrintable(c);
}

static inline bool isAlnum(uint8_t c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

size_t SignatureSanitizer::structuralGapPass(uint8_t* data, size_t start, size_t end) const
{
    size_t changed = 0;
    size_t i = start;

    while (i < end) {
        uint8_t* p = data + i;
        size_t avail = end - i;

        // Complete ID3v2 tag, or as much of it as the gap holds
        if (Tag::ID3v2Utils::isHeader(p, avail)) {
            size_t span = std::min(Tag::ID3v2Utils::totalTagSize(p), avail);
            changed += fill(p, span);
            i += span;
            continue;
        }
        if (Tag::ID3v2Utils::isFooter(p, avail)) {
            changed += fill(p, Tag::ID3v2Utils::FOOTER_SIZE);
            i += Tag::ID3v2Utils::FOOTER_SIZE;
            continue;
        }

        if (Tag::TagLocator::isAPEHeaderOrFooter(p, avail)) {
            size_t length = Tag::TagLocator::apeTagLength(p);
            if (readLE32(p + 20) & Tag::TagLocator::APE_FLAG_IS_HEADER) {
                // Header: items and footer follow
                size_t span = std::min(std::max(length, Tag::TagLocator::APE_FOOTER_SIZE), avail);
                changed += fill(p, span);
                i += span;
            } else {
                // Footer: items precede it
                size_t block_end = i + Tag::TagLocator::APE_FOOTER_SIZE;
                size_t back = std::min(std::max(length, Tag::TagLocator::APE_FOOTER_SIZE), block_end - start);
                changed += fill(data + block_end - back, back);
                i = block_end;
            }
            continue;
        }

        if (Tag::TagLocator::isID3v1(p, avail)) {
            changed += fill(p, Tag::TagLocator::ID3V1_SIZE);
            i += Tag::TagLocator::ID3V1_SIZE;
            continue;
        }

        // RIFF/IFF style chunk whose declared payload fits the gap
        if (avail >= 8 && isAlnum(p[0]) && isFourCCChar(p[1]) && isFourCCChar(p[2]) && isFourCCChar(p[3])) {
            uint64_t payload = readLE32(p + 4);
            uint64_t span = 8 + payload + (payload & 1);
            if (payload > 0 && span <= avail) {
                changed += fill(p, static_cast<size_t>(span));
                i += static_cast<size_t>(span);
                continue;
            }
        }

        // ID3v2.3 (plain) or 2.4 (synchsafe) frame header
        if (Tag::ID3v2Utils::isFrameHeader(p, avail)) {
            size_t body = readBE32(p + 4);
            if (Tag::ID3v2Utils::FRAME_HEADER_SIZE + body > avail) {
                body = Tag::ID3v2Utils::decodeSynchsafeBytes(p + 4);
            }
            size_t span = Tag::ID3v2Utils::FRAME_HEADER_SIZE;
            if (Tag::ID3v2Utils::FRAME_HEADER_SIZE + body <= avail) {
                span += body;
            }
            changed += fill(p, span);
            i += span;
            continue;
        }

        ++i;
    }
    return changed;
}

size_t SignatureSanitizer::structuralPass(uint8_t* data, const NonFrameRegion& region) const
{
    switch (region.kind) {
        case RegionKind::LeadingTag:
        case RegionKind::TrailingTag:
        case RegionKind::InfoFramePayload:
            return fill(data + region.sanitizableOffset(), region.sanitizableLength());
        case RegionKind::UnknownGap:
            break;
    }
    return structuralGapPass(data, region.sanitizableOffset(), region.sanitizableOffset() + region.sanitizableLength());
}

size_t SignatureSanitizer::textPass(uint8_t* data, size_t start, size_t end) const
{
    size_t changed = 0;
    size_t i = start;
    while (i < end) {
        if (!isPrintable(data[i])) {
            ++i;
            continue;
        }
        size_t run_end = i;
        while (run_end < end && isPrintable(data[run_end])) {
            ++run_end;
        }
        if (run_end - i >= MIN_TEXT_RUN) {
            changed += fill(data + i, run_end - i);
        }
        i = run_end;
    }
    return changed;
}

size_t SignatureSanitizer::literalPass(uint8_t* data, size_t start, size_t end, size_t& hits) const
{
    size_t changed = 0;
    for (const auto& token : m_tokens) {
        const size_t n = token.size();
        if (n == 0 || end - start < n) continue;
        for (size_t i = start; i + n <= end; ++i) {
            if (std::memcmp(data + i, token.data(), n) == 0) {
                ++hits;
                Debug::log("sanitizer", "literal token '", token, "' survived at offset ", i);
                changed += fill(data + i, n);
                i += n - 1;
            }
        }
    }
    return changed;
}

SanitizeReport SignatureSanitizer::sanitizeInPlace(std::vector<uint8_t>& bytes, const FrameIndex& index) const
{
    const size_t size = bytes.size();
    std::vector<NonFrameRegion> regions = index.regions();

    for (const auto& region : regions) {
        if (region.offset > size || region.length > size - region.offset) {
            throw MalformedStreamError("Region " + std::to_string(region.offset) + "+" +
                                       std::to_string(region.length) + " outside " +
                                       std::to_string(size) + " byte buffer");
        }
    }

    SanitizeReport report;
    report.regions = regions.size();
    uint8_t* data = bytes.data();

    // Clearing bytes can expose a shape that was broken before, so repeat
    // until a whole iteration is clean.
    for (;;) {
        size_t structural = 0;
        size_t text = 0;
        size_t literal = 0;

        for (const auto& region : regions) {
            structural += structuralPass(data, region);
        }
        for (const auto& region : regions) {
            text += textPass(data, region.sanitizableOffset(), region.sanitizableOffset() + region.sanitizableLength());
        }
        if (m_literal_check) {
            for (const auto& region : regions) {
                literal += literalPass(data, region.sanitizableOffset(),
                                       region.sanitizableOffset() + region.sanitizableLength(),
                                       report.literal_hits);
            }
        }

        report.structural_bytes += structural;
        report.text_bytes += text;
        report.literal_bytes += literal;
        if (structural + text + literal == 0) break;
        ++report.iterations;
    }

    if (report.literal_hits > 0) {
        Debug::log("sanitizer", "WARNING: ", report.literal_hits,
                   " literal token(s) were not caught by the structural and text passes");
    }
    DEBUG_LOG("sanitizer", report.regions, " regions: ", report.structural_bytes, " structural, ",
              report.text_bytes, " text, ", report.literal_bytes, " literal bytes cleared in ",
              report.iterations, " iteration(s)");
    return report;
}

std::vector<uint8_t> SignatureSanitizer::sanitize(const std::vector<uint8_t>& bytes, const FrameIndex& index,
                                                  SanitizeReport& report) const
{
    std::vector<uint8_t> out = bytes;
    report = sanitizeInPlace(out, index);
    return out;
}

std::vector<uint8_t> SignatureSanitizer::sanitize(const std::vector<uint8_t>& bytes, const FrameIndex& index) const
{
    SanitizeReport report;
    return sanitize(bytes, index, report);
}

} // namespace Sanitizer
} // namespace Hushmark
