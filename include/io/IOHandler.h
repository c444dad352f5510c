/*
 * IOHandler.h - Abstract I/O handler interface
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

#ifndef HUSHMARK_IO_IOHANDLER_H
#define HUSHMARK_IO_IOHANDLER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace IO {

/**
 * @brief Base IOHandler interface for unified I/O operations
 *
 * Decoder libraries with callback-driven input (libmpg123, libvorbisfile,
 * libFLAC) read through this interface, so a decoder never cares where
 * its bytes live.
 */
class IOHandler {
public:
    IOHandler() = default;
    virtual ~IOHandler() = default;

    IOHandler(const IOHandler&) = delete;
    IOHandler& operator=(const IOHandler&) = delete;

    /**
     * @brief Read data from the source with fread-like semantics
     * @param buffer Buffer to read data into
     * @param size Size of each element to read
     * @param count Number of elements to read
     * @return Number of elements successfully read
     */
    virtual size_t read(void* buffer, size_t size, size_t count) = 0;

    /**
     * @brief Seek to a position in the source
     * @param offset Offset to seek to
     * @param whence SEEK_SET, SEEK_CUR, or SEEK_END positioning mode
     * @return 0 on success, -1 on failure
     */
    virtual int seek(off_t offset, int whence) = 0;

    /**
     * @brief Get current byte offset position
     * @return Current position, -1 on failure
     */
    virtual off_t tell() = 0;

    /**
     * @brief Close the I/O source and cleanup resources
     * @return 0 on success, standard error codes on failure
     */
    virtual int close() = 0;

    virtual bool eof() = 0;

    /**
     * @brief Get total size of the source in bytes
     * @return Size in bytes, or -1 if unknown
     */
    virtual off_t getFileSize() = 0;

    /**
     * @brief Get the last error code
     * @return Error code (0 = no error)
     */
    int getLastError() const { return m_error.load(); }

protected:
    /**
     * @brief Thread-safe error state update
     * @param error_code New error code
     * @param error_message Optional error message for logging
     */
    void updateErrorState(int error_code, const std::string& error_message = "");

    std::atomic<bool> m_closed{false};
    std::atomic<int> m_error{0};

    // Allows concurrent size queries, exclusive reads and seeks
    mutable std::shared_mutex m_operation_mutex;
};

} // namespace IO
} // namespace Hushmark

#endif // HUSHMARK_IO_IOHANDLER_H
