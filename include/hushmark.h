/*
 * hushmark.h - main include for all other source files.
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

#ifndef __HUSHMARK_H__
#define __HUSHMARK_H__

// defines
#define HUSHMARK_VERSION "1-CURRENT"
#define HUSHMARK_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

//
// C++ Standard Library
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <future>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

// C Standard Library (wrapped)
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// System-specific headers
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

// Third-party library headers
#include <mpg123.h>
#include <lame/lame.h>
#include <FLAC++/decoder.h>
#include <vorbis/vorbisfile.h>
#include <opus/opusfile.h>
#include <taglib/tstring.h>

// Local project headers (in dependency order where possible)
#include "debug.h"
#include "exceptions.h"

// Core utilities and configuration
#include "core/utility/ByteOrder.h"
#include "core/utility/Base64.h"
#include "core/utility/G711.h"
#include "core/Config.h"

// I/O Handler subsystem
#include "io/IOHandler.h"
#include "io/MemoryIOHandler.h"

using Hushmark::IO::IOHandler;
using Hushmark::IO::MemoryIOHandler;

// Audio data model
#include "audio/AudioBuffer.h"
#include "audio/PCMStream.h"
#include "audio/FormatDetector.h"
#include "audio/PCMConditioner.h"

// Codec architecture
#include "codecs/AudioCodecBackend.h"
#include "codecs/CodecWorkerPool.h"
#include "codecs/wav/WaveCodec.h"
#include "codecs/mp3/MPG123Decoder.h"
#include "codecs/mp3/LameEncoder.h"
#include "codecs/flac/FLACDecoder.h"
#include "codecs/vorbis/VorbisDecoder.h"
#include "codecs/opus/OggOpusDecoder.h"
#include "codecs/LibraryCodecBackend.h"
#include "codecs/SubprocessCodecBackend.h"

// MPEG audio structure
#include "tag/ID3v2Utils.h"
#include "tag/TagLocator.h"
#include "mpeg/MPEGHeader.h"
#include "mpeg/FrameIndex.h"
#include "mpeg/StructuralFrameParser.h"

// Sanitization and pipeline
#include "sanitizer/SignatureSanitizer.h"
#include "pipeline/FormatStandardizer.h"
#include "pipeline/PipelineOrchestrator.h"
#include "audio/AudioChunker.h"

// Provider boundary
#include "provider/TTSProvider.h"
#include "provider/ProviderRegistry.h"
#include "provider/SynthesisService.h"

#endif // __HUSHMARK_H__
