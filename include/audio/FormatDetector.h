/*
 * FormatDetector.h - Container sniffing and format hint resolution
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_AUDIO_FORMATDETECTOR_H
#define HUSHMARK_AUDIO_FORMATDETECTOR_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Audio {

enum class AudioFormat {
    Unknown,
    WAV,
    MP3,
    Ogg,
    FLAC,
    AIFF,
    MP4
};

class FormatDetector {
public:
    /**
     * @brief Identify a container from its leading magic bytes.
     *
     * A leading ID3v2 tag is skipped first, so a tag glued in front of a
     * RIFF file still sniffs as WAV.
     */
    static AudioFormat sniff(const uint8_t *data, size_t size);
    static AudioFormat sniff(const std::vector<uint8_t>& data) { return sniff(data.data(), data.size()); }

    /**
     * @brief Resolve a caller supplied hint ("wav", ".MP3", "audio/ogg"...)
     * @return AudioFormat::Unknown if the hint is not recognised
     */
    static AudioFormat fromHint(const std::string& hint);

    static const char *name(AudioFormat format);

    /**
     * @brief Size of an ID3v2 tag at the start of the buffer, 0 if none.
     */
    static size_t leadingID3v2Size(const uint8_t *data, size_t size);
};

} // namespace Audio
} // namespace Hushmark

using Hushmark::Audio::AudioFormat;
using Hushmark::Audio::FormatDetector;

#endif // HUSHMARK_AUDIO_FORMATDETECTOR_H
