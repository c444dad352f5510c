/*
 * test_config.cpp - Unit tests for configuration parsing
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"
#include "test_framework.h"

using namespace TestFramework;

static std::string writeTempConfig(const std::string& contents)
{
    std::string path = "/tmp/hushmark_test_config_" + std::to_string(getpid()) + ".conf";
    std::ofstream out(path, std::ios::trunc);
    out << contents;
    return path;
}

class DefaultsTest : public TestCase {
public:
    DefaultsTest() : TestCase("Defaults") {}

protected:
    void runTest() override {
        Config config;
        ASSERT_TRUE(config.codec_backend == CodecBackendKind::Library, "Library backend");
        ASSERT_EQUALS(std::string("ffmpeg"), config.ffmpeg_path, "ffmpeg on PATH");
        ASSERT_EQUALS(30000u, config.codec_timeout_ms, "Timeout");
        ASSERT_TRUE(config.normalize, "Normalize on");
        ASSERT_TRUE(config.literal_check, "Literal check on");
        ASSERT_TRUE(config.extra_tokens.empty(), "No extra tokens");
    }
};

class ReadFileTest : public TestCase {
public:
    ReadFileTest() : TestCase("Config file overrides defaults") {}

protected:
    void runTest() override {
        std::string path = writeTempConfig(
            "# pipeline settings\n"
            "\n"
            "codec_backend = subprocess\n"
            "ffmpeg_path=/opt/ffmpeg/bin/ffmpeg\n"
            "codec_timeout_ms = 5000\n"
            "worker_threads = 4\n"
            "normalize = off\n"
            "highpass_hz = 35.5\n"
            "literal_check = no\n"
            "extra_tokens = VendorX, ,Studio9 \n"
            "debug_channels = pipeline,sanitizer\n"
            "this line has no equals sign\n"
            "colour = blue\n");

        Config config;
        config.readFile(path);
        std::remove(path.c_str());

        ASSERT_TRUE(config.codec_backend == CodecBackendKind::Subprocess, "Backend");
        ASSERT_EQUALS(std::string("/opt/ffmpeg/bin/ffmpeg"), config.ffmpeg_path, "Path");
        ASSERT_EQUALS(5000u, config.codec_timeout_ms, "Timeout");
        ASSERT_EQUALS(4u, config.worker_threads, "Workers");
        ASSERT_FALSE(config.normalize, "Normalize");
        ASSERT_TRUE(std::fabs(config.highpass_hz - 35.5) < 1e-9, "High-pass");
        ASSERT_FALSE(config.literal_check, "Literal check");
        ASSERT_EQUALS(2u, config.extra_tokens.size(), "Empty list items dropped");
        ASSERT_EQUALS(std::string("Studio9"), config.extra_tokens[1], "Items trimmed");
        ASSERT_EQUALS(2u, config.debug_channels.size(), "Channels");
    }
};

class SetTest : public TestCase {
public:
    SetTest() : TestCase("Single settings") {}

protected:
    void runTest() override {
        Config config;
        ASSERT_FALSE(config.set("no_such_key", "1"), "Unknown key reported");
        ASSERT_TRUE(config.set("worker_queue_depth", "3"), "Known key accepted");
        ASSERT_EQUALS(3u, config.worker_queue_depth, "Applied");

        TestPatterns::assertThrows<ConfigException>(
            [&]() { config.set("codec_backend", "gstreamer"); }, "Unknown codec backend");
        TestPatterns::assertThrows<ConfigException>(
            [&]() { config.set("codec_timeout_ms", "0"); }, "out of range");
        TestPatterns::assertThrows<ConfigException>(
            [&]() { config.set("worker_threads", "-2"); }, "Invalid value");
        TestPatterns::assertThrows<ConfigException>(
            [&]() { config.set("codec_timeout_ms", "99999999999999999999"); }, "out of range");
        TestPatterns::assertThrows<ConfigException>(
            [&]() { config.set("normalize", "maybe"); }, "Invalid boolean");
        TestPatterns::assertThrows<ConfigException>(
            [&]() { config.set("normalize", "\xC3\x9Cn"); }, "Invalid boolean");
        ASSERT_TRUE(config.set("normalize", "YES"), "Upper case boolean");
        ASSERT_TRUE(config.normalize, "Upper case boolean applied");
        TestPatterns::assertThrows<ConfigException>(
            [&]() { config.set("highpass_hz", "30Hz"); }, "highpass_hz");
        TestPatterns::assertThrows<ConfigException>(
            [&]() { config.set("highpass_hz", "30000"); }, "highpass_hz");
        TestPatterns::assertThrows<ConfigException>(
            [&]() { config.set("ffmpeg_path", ""); }, "must not be empty");
    }
};

class MissingFileTest : public TestCase {
public:
    MissingFileTest() : TestCase("Missing file is a ConfigException") {}

protected:
    void runTest() override {
        Config config;
        TestPatterns::assertThrows<ConfigException>(
            [&]() { config.readFile("/nonexistent/hushmark.conf"); }, "Cannot open");
    }
};

class LoadLogsUnknownKeysTest : public TestCase {
public:
    LoadLogsUnknownKeysTest() : TestCase("Unknown keys are logged when loading") {}

protected:
    void runTest() override {
        std::string path = writeTempConfig("bogus = 1\nworker_threads = 3\n");
        std::string log_path = "/tmp/hushmark_test_config_" + std::to_string(getpid()) + ".log";
        std::remove(log_path.c_str());

        Config config = Config::load(path, {{"debug_channels", "config"},
                                            {"log_file", log_path},
                                            {"codec_timeout_ms", "750"}});
        Debug::shutdown();
        std::remove(path.c_str());

        std::ifstream in(log_path);
        std::stringstream log;
        log << in.rdbuf();
        in.close();
        std::remove(log_path.c_str());

        ASSERT_TRUE(log.str().find("unknown key bogus ignored") != std::string::npos,
                    "Warning reaches the log file");
        ASSERT_EQUALS(3u, config.worker_threads, "File applied");
        ASSERT_EQUALS(750u, config.codec_timeout_ms, "Command line applied");
        ASSERT_EQUALS(log_path, config.log_file, "Log file kept");
    }
};

class LoadRejectsUnknownOverrideTest : public TestCase {
public:
    LoadRejectsUnknownOverrideTest() : TestCase("Unknown command line setting") {}

protected:
    void runTest() override {
        TestPatterns::assertThrows<ConfigException>(
            [&]() { Config::load("", {{"colour", "blue"}}); }, "Unknown setting");
        Debug::shutdown();
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Config Tests");

    suite.addTest(std::make_unique<DefaultsTest>());
    suite.addTest(std::make_unique<ReadFileTest>());
    suite.addTest(std::make_unique<SetTest>());
    suite.addTest(std::make_unique<MissingFileTest>());
    suite.addTest(std::make_unique<LoadLogsUnknownKeysTest>());
    suite.addTest(std::make_unique<LoadRejectsUnknownOverrideTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
