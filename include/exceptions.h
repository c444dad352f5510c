/*
 * exceptions.h - Various exception classes.
 * This file is part of Hushmark.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

namespace Hushmark {
namespace Core {

// Which pipeline stage gave up, and why.
enum class ErrorKind {
    Decode,
    Encode,
    MalformedStream,
    Timeout,
    Transport
};

const char *errorKindName(ErrorKind kind);

// Root of everything the library throws on purpose.
class HushmarkException : public std::exception
{
    public:
        HushmarkException(TagLib::String why);
        ~HushmarkException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        TagLib::String m_why;
        std::string m_what;
};

// A failure raised by one stage of the pipeline. The orchestrator rewraps
// these as PipelineError, keeping the kind.
class StageException : public HushmarkException
{
    public:
        StageException(ErrorKind kind, TagLib::String why);
        ~StageException() noexcept override = default;
        ErrorKind kind() const noexcept { return m_kind; }
    private:
        ErrorKind m_kind;
};

// The input container cannot be parsed by any decoder.
class DecodeError : public StageException
{
    public:
        DecodeError(TagLib::String why);
};

// Re-encoding the conditioned samples failed.
class EncodeError : public StageException
{
    public:
        EncodeError(TagLib::String why);
};

// Standardized output is not a usable MPEG stream, or a region lies
// outside the buffer. Both point at an internal defect.
class MalformedStreamError : public StageException
{
    public:
        MalformedStreamError(TagLib::String why);
};

// An external codec invocation ran past its deadline.
class TimeoutError : public StageException
{
    public:
        TimeoutError(TagLib::String why);
};

// Single error type surfaced by PipelineOrchestrator.
class PipelineError : public HushmarkException
{
    public:
        PipelineError(ErrorKind kind, TagLib::String why);
        ~PipelineError() noexcept override = default;
        ErrorKind kind() const noexcept { return m_kind; }
    private:
        ErrorKind m_kind;
};

// Configuration file cannot be read or holds an invalid value.
class ConfigException : public HushmarkException
{
    public:
        ConfigException(TagLib::String why);
};

// Lookup of a provider id that was never registered.
class ProviderNotFoundException : public HushmarkException
{
    public:
        ProviderNotFoundException(TagLib::String why);
};

/**
 * @brief Throw the StageException subclass matching @p kind.
 *
 * Transport has no stage class of its own and is thrown as PipelineError.
 */
[[noreturn]] void throwStageError(ErrorKind kind, TagLib::String why);

} // namespace Core
} // namespace Hushmark

using Hushmark::Core::ErrorKind;
using Hushmark::Core::HushmarkException;
using Hushmark::Core::StageException;
using Hushmark::Core::DecodeError;
using Hushmark::Core::EncodeError;
using Hushmark::Core::MalformedStreamError;
using Hushmark::Core::TimeoutError;
using Hushmark::Core::PipelineError;
using Hushmark::Core::ConfigException;
using Hushmark::Core::ProviderNotFoundException;

#endif // EXCEPTIONS_H
