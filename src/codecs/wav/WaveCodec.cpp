/*
 * WaveCodec.cpp - RIFF WAVE reader and writer
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Codec {

using namespace Core::Utility::ByteOrder;

// RIFF FourCC codes (in little-endian)
constexpr uint32_t RIFF_ID = 0x46464952; // "RIFF"
constexpr uint32_t WAVE_ID = 0x45564157; // "WAVE"
constexpr uint32_t FMT_ID  = 0x20746d66; // "fmt "
constexpr uint32_t DATA_ID = 0x61746164; // "data"

// WAVE format tags
constexpr uint16_t WAVE_FORMAT_PCM = 0x0001;
constexpr uint16_t WAVE_FORMAT_IEEE_FLOAT = 0x0003;
constexpr uint16_t WAVE_FORMAT_ALAW = 0x0006;
constexpr uint16_t WAVE_FORMAT_MULAW = 0x0007;
constexpr uint16_t WAVE_FORMAT_MPEGLAYER3 = 0x0055;
constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

void WaveCodec::convertSamples(WaveEncoding encoding, unsigned int bits, const uint8_t* in, size_t count,
                               int16_t* out)
{
    switch (encoding) {
    case WaveEncoding::PCM:
        if (bits == 8) {
            // 8-bit WAVE is unsigned. Convert to 16-bit signed.
            for (size_t i = 0; i < count; ++i) {
                out[i] = static_cast<int16_t>((static_cast<int>(in[i]) - 128) * 256);
            }
        } else if (bits == 16) {
            for (size_t i = 0; i < count; ++i) {
                out[i] = static_cast<int16_t>(readLE16(in + i * 2));
            }
        } else if (bits == 24) {
            // Keep the most significant 16 of 24 bits
            for (size_t i = 0; i < count; ++i) {
                out[i] = static_cast<int16_t>(readLE16(in + i * 3 + 1));
            }
        } else {
            for (size_t i = 0; i < count; ++i) {
                out[i] = static_cast<int16_t>(static_cast<int32_t>(readLE32(in + i * 4)) >> 16);
            }
        }
        break;
    case WaveEncoding::IEEE_FLOAT:
        for (size_t i = 0; i < count; ++i) {
            double sample;
            if (bits == 32) {
                uint32_t raw = readLE32(in + i * 4);
                float f;
                std::memcpy(&f, &raw, sizeof(f));
                sample = f;
            } else {
                uint64_t raw = static_cast<uint64_t>(readLE32(in + i * 8)) |
                               (static_cast<uint64_t>(readLE32(in + i * 8 + 4)) << 32);
                std::memcpy(&sample, &raw, sizeof(sample));
            }
            if (!std::isfinite(sample)) sample = 0.0;
            sample = std::clamp(sample, -1.0, 1.0);
            out[i] = static_cast<int16_t>(sample * 32767.0);
        }
        break;
    case WaveEncoding::ALAW:
        Core::Utility::G711::expandBlock(in, count, out, true);
        break;
    case WaveEncoding::MULAW:
        Core::Utility::G711::expandBlock(in, count, out, false);
        break;
    case WaveEncoding::Unsupported:
        throw DecodeError("Unsupported WAVE encoding");
    }
}

PCMStream WaveCodec::decode(const uint8_t* data, size_t size)
{
    size_t skip = Audio::FormatDetector::leadingID3v2Size(data, size);
    const uint8_t* p = data + skip;
    const size_t n = size - skip;

    if (n < 12 || readLE32(p) != RIFF_ID || readLE32(p + 8) != WAVE_ID) {
        throw DecodeError("Not a RIFF WAVE file.");
    }

    WaveEncoding encoding = WaveEncoding::Unsupported;
    unsigned int channels = 0;
    unsigned int rate = 0;
    unsigned int bits = 0;
    bool found_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= n) {
        uint32_t chunk_id = readLE32(p + pos);
        uint32_t chunk_size = readLE32(p + pos + 4);
        size_t body = pos + 8;

        if (chunk_id == FMT_ID) {
            if (chunk_size < 16 || body + 16 > n) {
                throw DecodeError("WAVE 'fmt ' chunk is truncated.");
            }
            uint16_t format_tag = readLE16(p + body);
            channels = readLE16(p + body + 2);
            rate = readLE32(p + body + 4);
            bits = readLE16(p + body + 14);

            // The real format tag lives in the first two bytes of the SubFormat GUID
            if (format_tag == WAVE_FORMAT_EXTENSIBLE && chunk_size >= 40 && body + 26 <= n) {
                format_tag = readLE16(p + body + 24);
            }

            switch (format_tag) {
            case WAVE_FORMAT_PCM:
                if (bits != 8 && bits != 16 && bits != 24 && bits != 32) {
                    throw DecodeError("Unsupported WAVE format: only 8, 16, 24 or 32-bit LPCM is supported.");
                }
                encoding = WaveEncoding::PCM;
                break;
            case WAVE_FORMAT_IEEE_FLOAT:
                if (bits != 32 && bits != 64) {
                    throw DecodeError("Unsupported WAVE format: only 32 or 64-bit IEEE Float is supported.");
                }
                encoding = WaveEncoding::IEEE_FLOAT;
                break;
            case WAVE_FORMAT_ALAW:
            case WAVE_FORMAT_MULAW:
                if (bits != 8) {
                    throw DecodeError("Unsupported WAVE format: G.711 must be 8 bits per sample.");
                }
                encoding = format_tag == WAVE_FORMAT_ALAW ? WaveEncoding::ALAW : WaveEncoding::MULAW;
                break;
            case WAVE_FORMAT_MPEGLAYER3:
                throw DecodeError("MP3 in WAVE container is not supported.");
            default:
                throw DecodeError("Unsupported WAVE format tag " + std::to_string(format_tag));
            }

            if (channels == 0 || rate == 0) {
                throw DecodeError("WAVE 'fmt ' chunk declares no channels or no sample rate.");
            }
            found_fmt = true;
        } else if (chunk_id == DATA_ID) {
            if (!found_fmt) throw DecodeError("WAVE 'data' chunk found before 'fmt ' chunk.");

            // Streamed or truncated files declare more data than they hold
            size_t data_size = std::min(static_cast<size_t>(chunk_size), n - body);
            size_t bytes_per_sample = bits / 8;
            size_t frames = data_size / (bytes_per_sample * channels);

            PCMStream pcm;
            pcm.sample_rate = rate;
            pcm.channels = channels;
            pcm.bits_per_sample = 16;
            pcm.samples.resize(frames * channels);
            convertSamples(encoding, bits, p + body, pcm.samples.size(), pcm.samples.data());

            Debug::log("codec", "WAVE: ", channels, "ch ", rate, "Hz ", bits, "-bit, ", frames, " frames");
            return pcm;
        }

        // Seek to the next chunk, accounting for padding byte if chunk size is odd.
        if (chunk_size > n - body) break;
        pos = body + chunk_size + (chunk_size & 1);
    }
    throw DecodeError("WAVE file is missing 'data' chunk.");
}

std::vector<uint8_t> WaveCodec::encode(const PCMStream& pcm)
{
    return encode(pcm, 0, pcm.frames());
}

std::vector<uint8_t> WaveCodec::encode(const PCMStream& pcm, size_t first_frame, size_t frame_count)
{
    const unsigned int channels = pcm.channels ? pcm.channels : 1;
    first_frame = std::min(first_frame, pcm.frames());
    frame_count = std::min(frame_count, pcm.frames() - first_frame);

    const uint32_t data_size = static_cast<uint32_t>(frame_count * channels * 2);
    std::vector<uint8_t> out;
    out.reserve(44 + data_size);

    appendFourCC(out, "RIFF");
    appendLE32(out, 36 + data_size);
    appendFourCC(out, "WAVE");
    appendFourCC(out, "fmt ");
    appendLE32(out, 16);
    appendLE16(out, WAVE_FORMAT_PCM);
    appendLE16(out, static_cast<uint16_t>(channels));
    appendLE32(out, pcm.sample_rate);
    appendLE32(out, pcm.sample_rate * channels * 2);
    appendLE16(out, static_cast<uint16_t>(channels * 2));
    appendLE16(out, 16);
    appendFourCC(out, "data");
    appendLE32(out, data_size);

    const int16_t* s = pcm.samples.data() + first_frame * channels;
    for (size_t i = 0; i < frame_count * channels; ++i) {
        appendLE16(out, static_cast<uint16_t>(s[i]));
    }
    return out;
}

} // namespace Codec
} // namespace Hushmark
