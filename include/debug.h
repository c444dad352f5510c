/*
 * debug.h - Debug output system header
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef DEBUG_H
#define DEBUG_H

// No direct #include <mutex>
#include <iostream>
#include <unordered_set>
#include <sstream>
// should be in hushmark.h

class Debug {
public:
    static void init(const std::string& logfile, const std::vector<std::string>& channels);
    static void shutdown();

    // Check if a debug channel is enabled (O(1) lookup)
    static bool isChannelEnabled(const std::string& channel);

    // Basic logging without location info
    template<typename... Args>
    static inline void log(const std::string& channel, Args&&... args) {
        if (isChannelEnabled(channel)) {
            std::stringstream ss;
            if constexpr (sizeof...(args) > 0) {
                (ss << ... << args);
            }
            write(channel, "", 0, ss.str());
        }
    }

    // Logging with function and line number
    template<typename... Args>
    static inline void log(const std::string& channel, const char* function, int line, Args&&... args) {
        if (isChannelEnabled(channel)) {
            std::stringstream ss;
            if constexpr (sizeof...(args) > 0) {
                (ss << ... << args);
            }
            write(channel, function, line, ss.str());
        }
    }

private:
    static void write(const std::string& channel, const std::string& function, int line, const std::string& message);

    static std::ofstream m_logfile;
    static std::mutex m_mutex;
    static std::shared_mutex m_channels_mutex;
    static std::unordered_set<std::string> m_enabled_channels;
    static bool m_log_to_file;
};

// Convenience macro for logging with location info
#define DEBUG_LOG(channel, ...) Debug::log(channel, __FUNCTION__, __LINE__, __VA_ARGS__)

#endif // DEBUG_H
