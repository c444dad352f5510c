/*
 * Config.h - Runtime configuration for the anonymization pipeline
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_CORE_CONFIG_H
#define HUSHMARK_CORE_CONFIG_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Core {

enum class CodecBackendKind {
    Library,
    Subprocess
};

/**
 * @brief Plain value holding everything the pipeline can be tuned with.
 *
 * Defaults are usable as-is. A config file of key=value lines can
 * override them, and the CLI overrides the file.
 */
struct Config {
    CodecBackendKind codec_backend = CodecBackendKind::Library;
    std::string ffmpeg_path = "ffmpeg";
    unsigned int codec_timeout_ms = 30000;
    unsigned int worker_threads = 2;
    unsigned int worker_queue_depth = 16;
    bool normalize = true;
    double highpass_hz = 20.0;
    bool literal_check = true;
    std::vector<std::string> extra_tokens;
    std::string log_file;
    std::vector<std::string> debug_channels;

    /**
     * @brief Read key=value pairs from a file into this config.
     *
     * Blank lines and lines starting with '#' are skipped. Unknown keys are
     * logged on the "config" channel and ignored.
     *
     * @throws ConfigException if the file cannot be opened or a value is invalid
     */
    void readFile(const std::string& path);

    /**
     * @brief Apply a single key=value setting.
     * @return false if the key is not recognised
     * @throws ConfigException if the value does not parse for that key
     */
    bool set(const std::string& key, const std::string& value);

    /**
     * @brief Build the effective configuration for a run.
     *
     * Logging settings among @p overrides are applied and Debug is
     * initialised before @p path is read, so warnings about the file reach
     * the requested channels. The file (if @p path is non-empty) and then
     * all overrides are applied; Debug is re-initialised if the final
     * logging settings differ.
     *
     * @throws ConfigException as readFile() and set() do
     */
    static Config load(const std::string& path,
                       const std::vector<std::pair<std::string, std::string>>& overrides);

    static std::vector<std::string> splitList(const std::string& value);
};

const char *codecBackendName(CodecBackendKind kind);

} // namespace Core
} // namespace Hushmark

using Hushmark::Core::Config;
using Hushmark::Core::CodecBackendKind;

#endif // HUSHMARK_CORE_CONFIG_H
