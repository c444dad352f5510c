/*
 * VorbisDecoder.cpp - Ogg Vorbis decoding through libvorbisfile
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Codec {

// First page: 27-byte header, one lacing value, then the packet
constexpr size_t FIRST_PACKET_OFFSET = 28;

bool VorbisDecoder::isVorbis(const uint8_t* data, size_t size)
{
    return size >= FIRST_PACKET_OFFSET + 7 && std::memcmp(data, "OggS", 4) == 0 &&
           data[FIRST_PACKET_OFFSET] == 0x01 && std::memcmp(data + FIRST_PACKET_OFFSET + 1, "vorbis", 6) == 0;
}

VorbisDecoder::~VorbisDecoder()
{
    // ov_clear will call the close callback on our IOHandler.
    if (m_open) ov_clear(&m_vorbis_file);
}

PCMStream VorbisDecoder::decode(const uint8_t* data, size_t size)
{
    if (m_open) {
        throw DecodeError("VorbisDecoder instances decode a single buffer");
    }
    m_handler = std::make_unique<MemoryIOHandler>(data, size, false);

    // These callbacks forward to the generic IOHandler interface.
    ov_callbacks callbacks = {
        /* read_func */
        [](void *ptr, size_t size, size_t nmemb, void *datasource) -> size_t {
            return static_cast<IOHandler*>(datasource)->read(ptr, size, nmemb);
        },
        /* seek_func */
        [](void *datasource, ogg_int64_t offset, int whence) -> int {
            return static_cast<IOHandler*>(datasource)->seek(static_cast<off_t>(offset), whence);
        },
        /* close_func */
        [](void *datasource) -> int {
            return static_cast<IOHandler*>(datasource)->close();
        },
        /* tell_func */
        [](void *datasource) -> long {
            return static_cast<long>(static_cast<IOHandler*>(datasource)->tell());
        }
    };

    int ret = ov_open_callbacks(m_handler.get(), &m_vorbis_file, nullptr, 0, callbacks);
    switch (ret) {
    case 0:
        break;
    case OV_ENOTVORBIS:
        throw DecodeError("Not a Vorbis stream");
    case OV_EREAD:
    case OV_EVERSION:
    case OV_EBADHEADER:
    case OV_EFAULT:
    default:
        throw DecodeError("ov_open_callbacks() failed, error code: " + std::to_string(ret));
    }
    m_open = true;

    vorbis_info *vi = ov_info(&m_vorbis_file, -1);
    if (!vi || vi->channels < 1 || vi->rate <= 0) {
        throw DecodeError("Vorbis stream has no usable format information");
    }

    PCMStream pcm;
    pcm.sample_rate = static_cast<unsigned int>(vi->rate);
    pcm.channels = static_cast<unsigned int>(vi->channels);
    pcm.bits_per_sample = 16;

    std::vector<char> buf(64 * 1024);
    int session = 0;
    for (;;) {
        long bytes_read = ov_read(&m_vorbis_file, buf.data(), static_cast<int>(buf.size()), 0, 2, 1, &session);
        if (bytes_read == OV_HOLE) {
            // Recoverable gap in the data
            continue;
        }
        if (bytes_read < 0) {
            throw DecodeError("ov_read() failed, error code: " + std::to_string(bytes_read));
        }
        if (bytes_read == 0) {
            break;
        }

        vorbis_info *current = ov_info(&m_vorbis_file, session);
        if (!current || current->channels != vi->channels || current->rate != vi->rate) {
            throw DecodeError("Chained Vorbis stream changes format");
        }

        size_t count = static_cast<size_t>(bytes_read) / sizeof(int16_t);
        size_t old = pcm.samples.size();
        pcm.samples.resize(old + count);
        std::memcpy(pcm.samples.data() + old, buf.data(), count * sizeof(int16_t));
    }

    if (pcm.samples.empty()) {
        throw DecodeError("Vorbis stream decoded to no samples");
    }
    Debug::log("codec", "vorbisfile: ", pcm.channels, "ch ", pcm.sample_rate, "Hz, ", pcm.frames(), " frames");
    return pcm;
}

PCMStream VorbisDecoder::decodeBuffer(const std::vector<uint8_t>& data)
{
    VorbisDecoder decoder;
    return decoder.decode(data.data(), data.size());
}

} // namespace Codec
} // namespace Hushmark
