/*
 * MemoryIOHandler.cpp - Memory-based IOHandler implementation
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef FINAL_BUILD
#include "hushmark.h"
#endif

namespace Hushmark {
namespace IO {

MemoryIOHandler::MemoryIOHandler(const void* data, size_t size, bool copy)
    : m_own_buffer(copy), m_pos(0) {
    if (copy) {
        if (data && size > 0) {
            m_buffer.assign(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size);
        }
    } else {
        m_external_data = static_cast<const uint8_t*>(data);
        m_external_size = size;
    }
}

size_t MemoryIOHandler::read(void* buffer, size_t size, size_t count) {
    // Exclusive: read advances m_pos
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return 0;
    }
    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    size_t bytes_requested = size * count;
    if (bytes_requested == 0) return 0;

    size_t total = sizeUnlocked();
    size_t available = m_pos < total ? total - m_pos : 0;
    // Whole elements only, like fread
    size_t to_read = std::min(bytes_requested, available - (available % size));

    if (to_read > 0) {
        const uint8_t* source = (m_own_buffer ? m_buffer.data() : m_external_data) + m_pos;
        std::memcpy(buffer, source, to_read);
        m_pos += to_read;
    }

    updateErrorState(0);
    return to_read / size;
}

int MemoryIOHandler::seek(off_t offset, int whence) {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return -1;
    }

    off_t new_pos;
    switch (whence) {
        case SEEK_SET:
            new_pos = offset;
            break;
        case SEEK_CUR:
            new_pos = static_cast<off_t>(m_pos) + offset;
            break;
        case SEEK_END:
            new_pos = static_cast<off_t>(sizeUnlocked()) + offset;
            break;
        default:
            updateErrorState(EINVAL);
            return -1;
    }

    if (new_pos < 0) {
        updateErrorState(EINVAL, "Seek before start of buffer");
        return -1;
    }

    // It is valid to seek past end of buffer (read will return 0)
    m_pos = static_cast<size_t>(new_pos);
    updateErrorState(0);
    return 0;
}

off_t MemoryIOHandler::tell() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    if (m_closed.load()) return -1;
    return static_cast<off_t>(m_pos);
}

int MemoryIOHandler::close() {
    std::unique_lock<std::shared_mutex> lock(m_operation_mutex);
    m_closed.store(true);
    m_buffer.clear();
    m_buffer.shrink_to_fit();
    m_external_data = nullptr;
    m_external_size = 0;
    return 0;
}

bool MemoryIOHandler::eof() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return m_closed.load() || m_pos >= sizeUnlocked();
}

off_t MemoryIOHandler::getFileSize() {
    std::shared_lock<std::shared_mutex> lock(m_operation_mutex);
    return static_cast<off_t>(sizeUnlocked());
}

} // namespace IO
} // namespace Hushmark
