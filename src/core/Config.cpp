/*
 * Config.cpp - Runtime configuration for the anonymization pipeline
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Core {

static std::string trim(const std::string& s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static unsigned int parseUnsigned(const std::string& key, const std::string& value, unsigned int minimum)
{
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigException("Invalid value for " + key + ": " + value);
    }
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value);
    } catch (const std::out_of_range&) {
        throw ConfigException("Value out of range for " + key + ": " + value);
    }
    if (parsed < minimum || parsed > std::numeric_limits<unsigned int>::max()) {
        throw ConfigException("Value out of range for " + key + ": " + value);
    }
    return static_cast<unsigned int>(parsed);
}

static bool parseBool(const std::string& key, const std::string& value)
{
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw ConfigException("Invalid boolean for " + key + ": " + value);
}

const char *codecBackendName(CodecBackendKind kind)
{
    return kind == CodecBackendKind::Subprocess ? "subprocess" : "library";
}

std::vector<std::string> Config::splitList(const std::string& value)
{
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

bool Config::set(const std::string& key, const std::string& value)
{
    if (key == "codec_backend") {
        if (value == "library") {
            codec_backend = CodecBackendKind::Library;
        } else if (value == "subprocess") {
            codec_backend = CodecBackendKind::Subprocess;
        } else {
            throw ConfigException("Unknown codec backend: " + value);
        }
    } else if (key == "ffmpeg_path") {
        if (value.empty()) throw ConfigException("ffmpeg_path must not be empty");
        ffmpeg_path = value;
    } else if (key == "codec_timeout_ms") {
        codec_timeout_ms = parseUnsigned(key, value, 1);
    } else if (key == "worker_threads") {
        worker_threads = parseUnsigned(key, value, 1);
    } else if (key == "worker_queue_depth") {
        worker_queue_depth = parseUnsigned(key, value, 1);
    } else if (key == "normalize") {
        normalize = parseBool(key, value);
    } else if (key == "highpass_hz") {
        char *end = nullptr;
        double hz = std::strtod(value.c_str(), &end);
        if (value.empty() || end == nullptr || *end != '\0' || !std::isfinite(hz) || hz < 0.0 || hz >= 22050.0) {
            throw ConfigException("Invalid value for highpass_hz: " + value);
        }
        highpass_hz = hz;
    } else if (key == "literal_check") {
        literal_check = parseBool(key, value);
    } else if (key == "extra_tokens") {
        extra_tokens = splitList(value);
    } else if (key == "log_file") {
        log_file = value;
    } else if (key == "debug_channels") {
        debug_channels = splitList(value);
    } else {
        return false;
    }
    return true;
}

void Config::readFile(const std::string& path)
{
    std::ifstream config(path);
    if (!config.is_open()) {
        throw ConfigException("Cannot open config file: " + path);
    }

    std::string line;
    unsigned int lineno = 0;
    while (std::getline(config, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t equals = line.find('=');
        if (equals == std::string::npos) {
            DEBUG_LOG("config", path, ":", lineno, ": ignoring line without '='");
            continue;
        }

        std::string key = trim(line.substr(0, equals));
        std::string value = trim(line.substr(equals + 1));

        if (!set(key, value)) {
            DEBUG_LOG("config", path, ":", lineno, ": unknown key ", key, " ignored");
        }
    }
    DEBUG_LOG("config", "loaded ", path, ", backend=", codecBackendName(codec_backend),
              ", timeout=", codec_timeout_ms, "ms, workers=", worker_threads);
}

Config Config::load(const std::string& path,
                    const std::vector<std::pair<std::string, std::string>>& overrides)
{
    Config config;
    for (const auto& kv : overrides) {
        if (kv.first == "debug_channels" || kv.first == "log_file") {
            config.set(kv.first, kv.second);
        }
    }
    Debug::init(config.log_file, config.debug_channels);
    const std::string early_log_file = config.log_file;
    const std::vector<std::string> early_channels = config.debug_channels;

    if (!path.empty()) {
        config.readFile(path);
    }
    for (const auto& kv : overrides) {
        if (!config.set(kv.first, kv.second)) {
            throw ConfigException("Unknown setting: " + kv.first);
        }
    }

    if (config.log_file != early_log_file || config.debug_channels != early_channels) {
        Debug::shutdown();
        Debug::init(config.log_file, config.debug_channels);
    }
    return config;
}

} // namespace Core
} // namespace Hushmark
