/*
 * SubprocessCodecBackend.cpp - Codec backend driving an external ffmpeg binary
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Codec {

using namespace Core::Utility;

namespace {

// Keep this much of the child's stderr for error messages
constexpr size_t STDERR_TAIL = 512;

void closeFd(int& fd)
{
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

void closePipe(int fds[2])
{
    closeFd(fds[0]);
    closeFd(fds[1]);
}

// Drain whatever is readable right now. Returns false once the writer has
// closed its end.
bool readAvailable(int fd, std::string& buffer)
{
    char temp_buffer[4096];
    while (true) {
        ssize_t bytes_read = read(fd, temp_buffer, sizeof(temp_buffer));
        if (bytes_read > 0) {
            buffer.append(temp_buffer, static_cast<size_t>(bytes_read));
        } else if (bytes_read == 0) {
            return false;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        } else {
            return false;
        }
    }
}

std::string stderrTail(const std::string& err)
{
    std::string tail = err.size() > STDERR_TAIL ? err.substr(err.size() - STDERR_TAIL) : err;
    while (!tail.empty() && std::isspace(static_cast<unsigned char>(tail.back()))) {
        tail.pop_back();
    }
    return tail;
}

void ignoreSigpipe()
{
    static std::once_flag once;
    std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

} // namespace

SubprocessCodecBackend::SubprocessCodecBackend(std::string ffmpeg_path, std::chrono::milliseconds timeout)
    : m_ffmpeg_path(std::move(ffmpeg_path)), m_timeout(timeout)
{
    if (m_ffmpeg_path.empty()) {
        throw std::invalid_argument("ffmpeg path must not be empty");
    }
}

const char *SubprocessCodecBackend::demuxerName(Audio::AudioFormat format)
{
    switch (format) {
    case AudioFormat::WAV:
        return "wav";
    case AudioFormat::MP3:
        return "mp3";
    case AudioFormat::Ogg:
        return "ogg";
    case AudioFormat::FLAC:
        return "flac";
    case AudioFormat::AIFF:
        return "aiff";
    case AudioFormat::MP4:
        return "mov";
    case AudioFormat::Unknown:
        break;
    }
    return nullptr;
}

ProcessResult SubprocessCodecBackend::runProcess(const std::vector<std::string>& argv,
                                                 const std::vector<uint8_t>& input,
                                                 std::chrono::milliseconds timeout, ErrorKind stage)
{
    if (argv.empty()) {
        throw std::invalid_argument("runProcess() needs a program name");
    }
    ignoreSigpipe();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) == -1 || pipe(stdout_pipe) == -1 || pipe(stderr_pipe) == -1) {
        int err = errno;
        closePipe(stdin_pipe);
        closePipe(stdout_pipe);
        closePipe(stderr_pipe);
        Core::throwStageError(stage, "pipe() failed: " + std::string(strerror(err)));
    }

    // Build argv before forking; only async-signal-safe calls after fork()
    std::vector<char*> argv_ptrs;
    argv_ptrs.reserve(argv.size() + 1);
    for (const std::string& arg : argv) {
        argv_ptrs.push_back(const_cast<char*>(arg.c_str()));
    }
    argv_ptrs.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        closePipe(stdin_pipe);
        closePipe(stdout_pipe);
        closePipe(stderr_pipe);
        Core::throwStageError(stage, "fork() failed: " + std::string(strerror(err)));
    }

    if (pid == 0) {
        // Child process
        if (dup2(stdin_pipe[0], STDIN_FILENO) == -1 ||
            dup2(stdout_pipe[1], STDOUT_FILENO) == -1 ||
            dup2(stderr_pipe[1], STDERR_FILENO) == -1) {
            _exit(127);
        }
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);

        execvp(argv_ptrs[0], argv_ptrs.data());
        _exit(127);
    }

    // Parent process
    closeFd(stdin_pipe[0]);
    closeFd(stdout_pipe[1]);
    closeFd(stderr_pipe[1]);
    int in_fd = stdin_pipe[1];
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    fcntl(in_fd, F_SETFL, O_NONBLOCK);
    fcntl(out_fd, F_SETFL, O_NONBLOCK);
    fcntl(err_fd, F_SETFL, O_NONBLOCK);

    Debug::log("codec", "runProcess(): started ", argv[0], " as pid ", pid, " with ", input.size(), " bytes of input");

    ProcessResult result;
    std::string out_buffer;
    size_t written = 0;
    if (input.empty()) {
        closeFd(in_fd);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (out_fd != -1 || err_fd != -1) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        int wait_ms = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count()) + 1;

        pollfd fds[3];
        nfds_t nfds = 0;
        int in_slot = -1, out_slot = -1, err_slot = -1;
        if (in_fd != -1) {
            fds[nfds] = {in_fd, POLLOUT, 0};
            in_slot = static_cast<int>(nfds++);
        }
        if (out_fd != -1) {
            fds[nfds] = {out_fd, POLLIN, 0};
            out_slot = static_cast<int>(nfds++);
        }
        if (err_fd != -1) {
            fds[nfds] = {err_fd, POLLIN, 0};
            err_slot = static_cast<int>(nfds++);
        }

        int ready = poll(fds, nfds, wait_ms);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            closeFd(in_fd);
            closeFd(out_fd);
            closeFd(err_fd);
            Core::throwStageError(stage, "poll() failed: " + std::string(strerror(err)));
        }
        if (ready == 0) {
            continue;
        }

        if (in_slot != -1 && fds[in_slot].revents) {
            if (fds[in_slot].revents & (POLLERR | POLLHUP)) {
                // Child stopped reading; it will report why on stderr
                closeFd(in_fd);
            } else {
                ssize_t n = write(in_fd, input.data() + written, input.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == input.size()) {
                        closeFd(in_fd);
                    }
                } else if (n == -1 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    closeFd(in_fd);
                }
            }
        }
        if (out_slot != -1 && fds[out_slot].revents) {
            if (!readAvailable(out_fd, out_buffer)) {
                closeFd(out_fd);
            }
        }
        if (err_slot != -1 && fds[err_slot].revents) {
            if (!readAvailable(err_fd, result.stderr_data)) {
                closeFd(err_fd);
            }
        }
    }

    closeFd(in_fd);
    closeFd(out_fd);
    closeFd(err_fd);

    // Output is closed; give the child until the deadline to exit
    int status = 0;
    while (!result.timed_out) {
        pid_t wait_result = waitpid(pid, &status, WNOHANG);
        if (wait_result == pid) {
            break;
        }
        if (wait_result == -1 && errno != EINTR) {
            int err = errno;
            Core::throwStageError(stage, "waitpid() failed: " + std::string(strerror(err)));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (result.timed_out) {
        Debug::log("codec", "runProcess(): pid ", pid, " exceeded ", timeout.count(), "ms, killing");
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal_number = WTERMSIG(status);
    }
    result.stdout_data.assign(out_buffer.begin(), out_buffer.end());

    Debug::log("codec", "runProcess(): pid ", pid, " exited with ", result.exit_code,
               ", ", result.stdout_data.size(), " bytes of output");
    return result;
}

void SubprocessCodecBackend::checkResult(const ProcessResult& result, ErrorKind stage, const char *what) const
{
    if (result.timed_out) {
        throw TimeoutError(TagLib::String(what) + " via " + m_ffmpeg_path + " did not finish within " +
                           std::to_string(m_timeout.count()) + "ms");
    }
    if (result.exit_code == 127) {
        Core::throwStageError(stage, "could not execute " + m_ffmpeg_path);
    }
    if (result.signal_number != 0) {
        Core::throwStageError(stage, std::string(what) + " killed by signal " + std::to_string(result.signal_number));
    }
    if (result.exit_code != 0) {
        Core::throwStageError(stage, std::string(what) + " failed with exit code " +
                              std::to_string(result.exit_code) + ": " + stderrTail(result.stderr_data));
    }
}

PCMStream SubprocessCodecBackend::decodeToPCM(const AudioBuffer& input, Audio::AudioFormat format) const
{
    if (input.empty()) {
        throw DecodeError("empty input buffer");
    }

    std::vector<std::string> argv = {m_ffmpeg_path, "-hide_banner", "-loglevel", "error"};
    if (const char *demuxer = demuxerName(format)) {
        argv.push_back("-f");
        argv.push_back(demuxer);
    }
    const std::vector<std::string> tail = {
        "-i", "pipe:0", "-f", "s16le", "-acodec", "pcm_s16le",
        "-ar", std::to_string(EncoderProfile::SAMPLE_RATE),
        "-ac", std::to_string(EncoderProfile::CHANNELS), "pipe:1"};
    argv.insert(argv.end(), tail.begin(), tail.end());

    ProcessResult result = runProcess(argv, input.bytes(), m_timeout, ErrorKind::Decode);
    checkResult(result, ErrorKind::Decode, "ffmpeg decode");

    PCMStream pcm;
    pcm.sample_rate = EncoderProfile::SAMPLE_RATE;
    pcm.channels = EncoderProfile::CHANNELS;
    pcm.samples.resize(result.stdout_data.size() / 2);
    for (size_t i = 0; i < pcm.samples.size(); ++i) {
        pcm.samples[i] = static_cast<int16_t>(ByteOrder::readLE16(result.stdout_data.data() + i * 2));
    }
    if (pcm.empty()) {
        throw DecodeError("ffmpeg produced no samples");
    }
    return pcm;
}

std::vector<uint8_t> SubprocessCodecBackend::encodeFromPCM(const PCMStream& pcm) const
{
    if (pcm.channels != EncoderProfile::CHANNELS || pcm.sample_rate != EncoderProfile::SAMPLE_RATE) {
        throw EncodeError("ffmpeg encoder expects mono 44100 Hz PCM, got " + std::to_string(pcm.channels) +
                          "ch " + std::to_string(pcm.sample_rate) + "Hz");
    }

    std::vector<uint8_t> raw;
    raw.reserve(pcm.samples.size() * 2);
    for (int16_t sample : pcm.samples) {
        ByteOrder::appendLE16(raw, static_cast<uint16_t>(sample));
    }

    const std::vector<std::string> argv = {
        m_ffmpeg_path, "-hide_banner", "-loglevel", "error",
        "-f", "s16le", "-ar", std::to_string(EncoderProfile::SAMPLE_RATE),
        "-ac", std::to_string(EncoderProfile::CHANNELS), "-i", "pipe:0",
        "-codec:a", "libmp3lame", "-b:a", std::to_string(EncoderProfile::BITRATE_KBPS) + "k",
        "-map_metadata", "-1", "-id3v2_version", "0", "-write_id3v1", "0", "-write_xing", "0",
        "-fflags", "+bitexact", "-flags:a", "+bitexact",
        "-f", "mp3", "pipe:1"};

    ProcessResult result = runProcess(argv, raw, m_timeout, ErrorKind::Encode);
    checkResult(result, ErrorKind::Encode, "ffmpeg encode");

    if (result.stdout_data.empty()) {
        throw EncodeError("ffmpeg produced no MP3 data");
    }
    return std::move(result.stdout_data);
}

} // namespace Codec
} // namespace Hushmark
