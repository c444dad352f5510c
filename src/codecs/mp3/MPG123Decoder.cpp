/*
 * MPG123Decoder.cpp - MPEG audio decoding through libmpg123
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Codec {

// RAII wrapper for libmpg123 initialization and cleanup.
// The first decoder constructed brings the library up; it is torn down
// at program termination.
class Mpg123LifecycleManager {
public:
    Mpg123LifecycleManager() {
        m_status = mpg123_init();
    }
    ~Mpg123LifecycleManager() {
        if (m_status == MPG123_OK) mpg123_exit();
    }
    int status() const { return m_status; }
private:
    int m_status;
};

static void ensureMpg123()
{
    static Mpg123LifecycleManager mpg123_manager;
    if (mpg123_manager.status() != MPG123_OK) {
        throw DecodeError("Failed to initialize libmpg123: " +
                          TagLib::String(mpg123_plain_strerror(mpg123_manager.status())));
    }
}

// Callback functions for libmpg123 to read from our IOHandler.
// These must have C linkage and cannot be member functions.

static ssize_t read_callback(void *handle, void *buffer, size_t count)
{
    return static_cast<ssize_t>(static_cast<IOHandler*>(handle)->read(buffer, 1, count));
}

static off_t lseek_callback(void *handle, off_t offset, int whence)
{
    auto* handler = static_cast<IOHandler*>(handle);
    if (handler->seek(offset, whence) != 0) {
        return -1;
    }
    return handler->tell();
}

static void cleanup_callback(void *handle)
{
    // Lifetime is owned by MPG123Decoder::m_handler; only close here.
    static_cast<IOHandler*>(handle)->close();
}

MPG123Decoder::MPG123Decoder() : m_mpg_handle(nullptr)
{
    ensureMpg123();
    int err = MPG123_OK;
    m_mpg_handle = mpg123_new(nullptr, &err);
    if (!m_mpg_handle) {
        throw DecodeError("mpg123_new() failed: " + TagLib::String(mpg123_plain_strerror(err)));
    }
    err = mpg123_param(m_mpg_handle, MPG123_ADD_FLAGS, MPG123_QUIET, 0);
    if (err != MPG123_OK) {
        mpg123_delete(m_mpg_handle);
        throw DecodeError("mpg123_param() failed: " + TagLib::String(mpg123_plain_strerror(err)));
    }
}

MPG123Decoder::~MPG123Decoder()
{
    // mpg123_close will trigger our cleanup_callback, which closes the handler.
    if (m_open) mpg123_close(m_mpg_handle);
    mpg123_delete(m_mpg_handle);
}

PCMStream MPG123Decoder::decode(const uint8_t* data, size_t size)
{
    if (m_open) {
        throw DecodeError("MPG123Decoder instances decode a single buffer");
    }
    m_handler = std::make_unique<MemoryIOHandler>(data, size, false);

    int ret = mpg123_replace_reader_handle(m_mpg_handle, read_callback, lseek_callback, cleanup_callback);
    if (ret != MPG123_OK) {
        throw DecodeError("mpg123_replace_reader_handle() failed: " + TagLib::String(mpg123_strerror(m_mpg_handle)));
    }

    ret = mpg123_open_handle(m_mpg_handle, m_handler.get());
    if (ret != MPG123_OK) {
        throw DecodeError("mpg123_open_handle() failed: " + TagLib::String(mpg123_strerror(m_mpg_handle)));
    }
    m_open = true;

    long rate = 0;
    int channels = 0;
    int encoding = 0;
    ret = mpg123_getformat(m_mpg_handle, &rate, &channels, &encoding);
    if (ret != MPG123_OK) {
        throw DecodeError("mpg123_getformat() failed: " + TagLib::String(mpg123_strerror(m_mpg_handle)));
    }
    ret = mpg123_format_none(m_mpg_handle);
    if (ret != MPG123_OK) {
        throw DecodeError("mpg123_format_none() failed: " + TagLib::String(mpg123_strerror(m_mpg_handle)));
    }
    ret = mpg123_format(m_mpg_handle, rate, channels, MPG123_ENC_SIGNED_16);
    if (ret != MPG123_OK) {
        throw DecodeError("mpg123_format() failed: " + TagLib::String(mpg123_strerror(m_mpg_handle)));
    }

    PCMStream pcm;
    pcm.sample_rate = static_cast<unsigned int>(rate);
    pcm.channels = static_cast<unsigned int>(channels);
    pcm.bits_per_sample = 16;

    std::vector<unsigned char> buf(64 * 1024);
    for (;;) {
        size_t actual = 0;
        int cond = mpg123_read(m_mpg_handle, buf.data(), buf.size(), &actual);
        if (actual > 0) {
            size_t count = actual / sizeof(int16_t);
            size_t old = pcm.samples.size();
            pcm.samples.resize(old + count);
            std::memcpy(pcm.samples.data() + old, buf.data(), count * sizeof(int16_t));
        }
        if (cond == MPG123_DONE) {
            break;
        }
        if (cond == MPG123_NEW_FORMAT) {
            long new_rate = 0;
            int new_channels = 0;
            if (mpg123_getformat(m_mpg_handle, &new_rate, &new_channels, &encoding) != MPG123_OK) {
                throw DecodeError("mpg123_getformat() failed: " + TagLib::String(mpg123_strerror(m_mpg_handle)));
            }
            if (new_rate != rate || new_channels != channels) {
                throw DecodeError("MPEG stream changes format mid-stream");
            }
            continue;
        }
        if (cond != MPG123_OK) {
            throw DecodeError("mpg123_read() failed: " + TagLib::String(mpg123_strerror(m_mpg_handle)));
        }
    }

    if (pcm.samples.empty()) {
        throw DecodeError("MPEG stream decoded to no samples");
    }
    Debug::log("codec", "mpg123: ", channels, "ch ", rate, "Hz, ", pcm.frames(), " frames from ", size, " bytes");
    return pcm;
}

PCMStream MPG123Decoder::decodeBuffer(const std::vector<uint8_t>& data)
{
    MPG123Decoder decoder;
    return decoder.decode(data.data(), data.size());
}

} // namespace Codec
} // namespace Hushmark
