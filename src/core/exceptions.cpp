/*
 * exceptions.cpp - Exception class implementations.
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

#include "hushmark.h"

namespace Hushmark {
namespace Core {

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Decode:
    return "DecodeError";
  case ErrorKind::Encode:
    return "EncodeError";
  case ErrorKind::MalformedStream:
    return "MalformedStreamError";
  case ErrorKind::Timeout:
    return "TimeoutError";
  case ErrorKind::Transport:
    return "TransportError";
  }
  return "UnknownError";
}

/**
 * @brief Constructs a HushmarkException.
 *
 * The reason is kept as a TagLib::String and converted once to UTF-8 so
 * that what() can hand out a stable pointer.
 * @param why A string describing the reason for the failure.
 */
HushmarkException::HushmarkException(TagLib::String why)
    : std::exception(), m_why(why), m_what(why.to8Bit(true)) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A UTF-8 C-string describing the failure.
 */
const char *HushmarkException::what() const noexcept {
  return m_what.c_str();
}

StageException::StageException(ErrorKind kind, TagLib::String why)
    : HushmarkException(why), m_kind(kind) {
  // ctor
}

/**
 * @brief Constructs a DecodeError.
 *
 * Thrown when no decoder can make sense of the input container, either
 * because the format is unknown or the data inside it is corrupt.
 * @param why A string describing the decode failure.
 */
DecodeError::DecodeError(TagLib::String why)
    : StageException(ErrorKind::Decode, why) {
  // ctor
}

/**
 * @brief Constructs an EncodeError.
 * @param why A string describing the encoder failure.
 */
EncodeError::EncodeError(TagLib::String why)
    : StageException(ErrorKind::Encode, why) {
  // ctor
}

/**
 * @brief Constructs a MalformedStreamError.
 *
 * The standardizer guarantees decodable audio, so this only fires on an
 * internal inconsistency: no frames found, or a region out of bounds.
 * @param why A string describing the inconsistency.
 */
MalformedStreamError::MalformedStreamError(TagLib::String why)
    : StageException(ErrorKind::MalformedStream, why) {
  // ctor
}

/**
 * @brief Constructs a TimeoutError.
 * @param why A string naming the codec call that timed out.
 */
TimeoutError::TimeoutError(TagLib::String why)
    : StageException(ErrorKind::Timeout, why) {
  // ctor
}

/**
 * @brief Constructs a PipelineError.
 * @param kind The error kind of the stage that failed.
 * @param why The originating stage's message.
 */
PipelineError::PipelineError(ErrorKind kind, TagLib::String why)
    : HushmarkException(why), m_kind(kind) {
  // ctor
}

ConfigException::ConfigException(TagLib::String why)
    : HushmarkException(why) {
  // ctor
}

ProviderNotFoundException::ProviderNotFoundException(TagLib::String why)
    : HushmarkException(why) {
  // ctor
}

void throwStageError(ErrorKind kind, TagLib::String why) {
  switch (kind) {
  case ErrorKind::Decode:
    throw DecodeError(why);
  case ErrorKind::Encode:
    throw EncodeError(why);
  case ErrorKind::MalformedStream:
    throw MalformedStreamError(why);
  case ErrorKind::Timeout:
    throw TimeoutError(why);
  case ErrorKind::Transport:
    break;
  }
  throw PipelineError(kind, why);
}

} // namespace Core
} // namespace Hushmark
