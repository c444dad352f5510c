/*
 * MemoryIOHandler.h - Memory-based IOHandler implementation
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

#ifndef HUSHMARK_IO_MEMORYIOHANDLER_H
#define HUSHMARK_IO_MEMORYIOHANDLER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace IO {

/**
 * @brief Memory-based IOHandler implementation
 *
 * Allows reading from a memory buffer as if it were a file. Either copies
 * the data or references an external buffer that must outlive the handler.
 */
class MemoryIOHandler : public IOHandler {
public:
    /**
     * @brief Construct from existing data (copy or reference)
     * @param data Pointer to data
     * @param size Size of data
     * @param copy If true, copies data to internal buffer. If false, references external data (must remain valid).
     */
    MemoryIOHandler(const void* data, size_t size, bool copy = true);

    ~MemoryIOHandler() override = default;

    // IOHandler interface
    size_t read(void* buffer, size_t size, size_t count) override;
    int seek(off_t offset, int whence) override;
    off_t tell() override;
    int close() override;
    bool eof() override;
    off_t getFileSize() override;

private:
    size_t sizeUnlocked() const { return m_own_buffer ? m_buffer.size() : m_external_size; }

    std::vector<uint8_t> m_buffer;
    const uint8_t* m_external_data = nullptr;
    size_t m_external_size = 0;
    bool m_own_buffer = true;
    size_t m_pos = 0;
};

} // namespace IO
} // namespace Hushmark

#endif // HUSHMARK_IO_MEMORYIOHANDLER_H
