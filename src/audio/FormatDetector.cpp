/*
 * FormatDetector.cpp - Container sniffing and format hint resolution
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Audio {

size_t FormatDetector::leadingID3v2Size(const uint8_t *data, size_t size)
{
    if (!Tag::ID3v2Utils::isHeader(data, size)) return 0;
    size_t total = Tag::ID3v2Utils::totalTagSize(data);
    return std::min(total, size);
}

AudioFormat FormatDetector::sniff(const uint8_t *data, size_t size)
{
    size_t skip = leadingID3v2Size(data, size);
    const uint8_t *p = data + skip;
    size_t n = size - skip;

    if (n >= 12 && std::memcmp(p, "RIFF", 4) == 0 && std::memcmp(p + 8, "WAVE", 4) == 0) {
        return AudioFormat::WAV;
    }
    if (n >= 4 && std::memcmp(p, "OggS", 4) == 0) {
        return AudioFormat::Ogg;
    }
    if (n >= 4 && std::memcmp(p, "fLaC", 4) == 0) {
        return AudioFormat::FLAC;
    }
    if (n >= 12 && std::memcmp(p, "FORM", 4) == 0 &&
        (std::memcmp(p + 8, "AIFF", 4) == 0 || std::memcmp(p + 8, "AIFC", 4) == 0)) {
        return AudioFormat::AIFF;
    }
    if (n >= 8 && std::memcmp(p + 4, "ftyp", 4) == 0) {
        return AudioFormat::MP4;
    }
    if (n >= 4 && MPEG::MPEGHeader::parse(p, n).has_value()) {
        return AudioFormat::MP3;
    }
    // An ID3v2 tag with nothing recognisable behind it is most likely MP3.
    if (skip > 0) {
        return AudioFormat::MP3;
    }
    return AudioFormat::Unknown;
}

AudioFormat FormatDetector::fromHint(const std::string& hint)
{
    std::string h = hint;
    std::transform(h.begin(), h.end(), h.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Accept MIME types as well as extensions
    size_t slash = h.rfind('/');
    if (slash != std::string::npos) h = h.substr(slash + 1);
    size_t dot = h.rfind('.');
    if (dot != std::string::npos) h = h.substr(dot + 1);
    if (h.compare(0, 2, "x-") == 0) h = h.substr(2);

    if (h == "wav" || h == "wave") return AudioFormat::WAV;
    if (h == "mp3" || h == "mpeg" || h == "mpga" || h == "mp2") return AudioFormat::MP3;
    if (h == "ogg" || h == "oga" || h == "opus" || h == "vorbis") return AudioFormat::Ogg;
    if (h == "flac") return AudioFormat::FLAC;
    if (h == "aiff" || h == "aif" || h == "aifc") return AudioFormat::AIFF;
    if (h == "m4a" || h == "mp4" || h == "aac") return AudioFormat::MP4;
    return AudioFormat::Unknown;
}

const char *FormatDetector::name(AudioFormat format)
{
    switch (format) {
        case AudioFormat::WAV: return "wav";
        case AudioFormat::MP3: return "mp3";
        case AudioFormat::Ogg: return "ogg";
        case AudioFormat::FLAC: return "flac";
        case AudioFormat::AIFF: return "aiff";
        case AudioFormat::MP4: return "m4a";
        case AudioFormat::Unknown: break;
    }
    return "unknown";
}

} // namespace Audio
} // namespace Hushmark
