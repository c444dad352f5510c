/*
 * SubprocessCodecBackend.h - Codec backend driving an external ffmpeg binary
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CODECS_SUBPROCESSCODECBACKEND_H
#define HUSHMARK_CODECS_SUBPROCESSCODECBACKEND_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Codec {

/**
 * @brief Outcome of one child process run by SubprocessCodecBackend.
 */
struct ProcessResult {
    int exit_code = -1;         // -1 if the child did not exit normally
    int signal_number = 0;      // Signal that ended the child, if any
    bool timed_out = false;
    std::vector<uint8_t> stdout_data;
    std::string stderr_data;
};

/**
 * @brief Pipes audio through ffmpeg: container in on stdin, raw s16le out
 * on stdout for decode; raw s16le in, tagless MP3 out for encode.
 *
 * The child is killed with SIGKILL once its deadline passes. Decoding
 * always yields mono 44100 Hz PCM because ffmpeg does the down-mix and
 * resampling.
 */
class SubprocessCodecBackend : public AudioCodecBackend {
public:
    SubprocessCodecBackend(std::string ffmpeg_path, std::chrono::milliseconds timeout);

    PCMStream decodeToPCM(const AudioBuffer& input, Audio::AudioFormat format) const override;
    std::vector<uint8_t> encodeFromPCM(const PCMStream& pcm) const override;
    const char *name() const override { return "subprocess"; }

    const std::string& ffmpegPath() const { return m_ffmpeg_path; }

    /**
     * @brief Run @p argv with @p input on its stdin, collecting stdout and
     * stderr until it exits or @p timeout passes.
     *
     * argv[0] is looked up in PATH. A child that cannot be executed exits
     * with status 127.
     *
     * @param stage Error kind raised if the child cannot be started
     */
    static ProcessResult runProcess(const std::vector<std::string>& argv, const std::vector<uint8_t>& input,
                                    std::chrono::milliseconds timeout, ErrorKind stage);

    // ffmpeg demuxer name for a container, nullptr to let ffmpeg probe
    static const char *demuxerName(Audio::AudioFormat format);

private:
    void checkResult(const ProcessResult& result, ErrorKind stage, const char *what) const;

    std::string m_ffmpeg_path;
    std::chrono::milliseconds m_timeout;
};

} // namespace Codec
} // namespace Hushmark

using Hushmark::Codec::SubprocessCodecBackend;

#endif // HUSHMARK_CODECS_SUBPROCESSCODECBACKEND_H
