/*
 * test_pipeline_orchestrator.cpp - Pipeline stage wiring and error surfacing
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"
#include "test_framework.h"
#include "test_fixtures.h"
#include "mock_codec_backend.h"

using namespace TestFramework;
using namespace TestFixtures;
using namespace std::chrono_literals;
using Hushmark::MPEG::StructuralFrameParser;
using Hushmark::MPEG::FrameIndex;
using Hushmark::Sanitizer::SignatureSanitizer;

static PipelineOrchestrator makePipeline(std::shared_ptr<MockCodecBackend> backend,
                                         std::chrono::milliseconds timeout = 5000ms)
{
    return PipelineOrchestrator(makeMockStandardizer(backend, timeout), SignatureSanitizer());
}

// Runs @p fn and returns the kind of the PipelineError it throws
static std::optional<ErrorKind> pipelineErrorKind(const std::function<void()>& fn)
{
    try {
        fn();
    } catch (const PipelineError& e) {
        return e.kind();
    }
    return std::nullopt;
}

// ============================================================================
// Successful runs
// ============================================================================

class ProcessCleansVendorStreamTest : public TestCase {
public:
    ProcessCleansVendorStreamTest() : TestCase("Vendor tags and encoder strings are neutralized") {}

protected:
    void runTest() override {
        auto backend = std::make_shared<MockCodecBackend>();
        PipelineOrchestrator pipeline = makePipeline(backend);

        std::vector<uint8_t> wav = makeSineWav(44100, 1, 500);
        std::vector<uint8_t> out = pipeline.process(wav, std::string("wav"));

        std::vector<uint8_t> encoded = MockCodecBackend::vendorStream(44100 / 2 / 1152);
        ASSERT_EQUALS(encoded.size(), out.size(), "Same length as the encoder output");

        FrameIndex index = StructuralFrameParser().parse(encoded);
        ASSERT_TRUE(frameBytes(encoded, index) == frameBytes(out, index), "Audio frames untouched");

        for (const auto& region : index.regions()) {
            std::vector<uint8_t> bytes(out.begin() + region.sanitizableOffset(),
                                       out.begin() + region.sanitizableOffset() + region.sanitizableLength());
            for (const char *token : {"ID3", "Lavf", "ElevenLabs", "Xing", "LAME", "TAG", "aigc", "ContentProducer"}) {
                ASSERT_FALSE(contains(bytes, token), std::string("Token left in a region: ") + token);
            }
        }
        ASSERT_EQUALS(std::string("mp3"), std::string(PipelineOrchestrator::outputExtension()), "Extension");
    }
};

class ConditioningReachesEncoderTest : public TestCase {
public:
    ConditioningReachesEncoderTest() : TestCase("Encoder always sees mono 44.1 kHz") {}

protected:
    void runTest() override {
        auto backend = std::make_shared<MockCodecBackend>();
        PipelineOrchestrator pipeline = makePipeline(backend);

        const unsigned int rates[] = {8000, 22050, 48000};
        for (unsigned int rate : rates) {
            pipeline.process(makeSineWav(rate, 2, 250));
            PCMStream seen = backend->lastEncoded();
            ASSERT_EQUALS(1u, seen.channels, "Mono from " + std::to_string(rate));
            ASSERT_EQUALS(44100u, seen.sample_rate, "44.1 kHz from " + std::to_string(rate));
            ASSERT_TRUE(seen.frames() >= 11024 && seen.frames() <= 11026, "Duration kept from " + std::to_string(rate));
        }
    }
};

class HintFallbackTest : public TestCase {
public:
    HintFallbackTest() : TestCase("Wrong format hint falls back to the sniffed container") {}

protected:
    void runTest() override {
        auto backend = std::make_shared<MockCodecBackend>();
        PipelineOrchestrator pipeline = makePipeline(backend);

        std::vector<uint8_t> out = pipeline.process(makeSineWav(16000, 1, 100), std::string("audio/mpeg"));
        ASSERT_FALSE(out.empty(), "Processed");
        ASSERT_EQUALS(2u, backend->decodeCalls(), "Hinted attempt, then sniffed");

        pipeline.process(makeSineWav(16000, 1, 100), std::string("text/plain"));
        ASSERT_EQUALS(3u, backend->decodeCalls(), "Unknown hint is ignored");
    }
};

class TransportTest : public TestCase {
public:
    TransportTest() : TestCase("Base64 transport") {}

protected:
    void runTest() override {
        auto backend = std::make_shared<MockCodecBackend>();
        PipelineOrchestrator pipeline = makePipeline(backend);

        std::vector<uint8_t> wav = makeSineWav(22050, 1, 200);
        std::vector<uint8_t> direct = pipeline.process(wav);
        std::string encoded = pipeline.processTransport(Hushmark::Core::Utility::Base64::encode(wav));

        auto decoded = Hushmark::Core::Utility::Base64::decode(encoded);
        ASSERT_TRUE(decoded.has_value(), "Output is base64");
        ASSERT_TRUE(*decoded == direct, "Same bytes as process()");

        auto kind = pipelineErrorKind([&]() { pipeline.processTransport("this is *not* base64"); });
        ASSERT_TRUE(kind && *kind == ErrorKind::Transport, "Malformed payload is a transport error");
    }
};

class ConcurrentRequestsTest : public TestCase {
public:
    ConcurrentRequestsTest() : TestCase("Concurrent requests do not interfere") {}

protected:
    void runTest() override {
        auto backend = std::make_shared<MockCodecBackend>();
        PipelineOrchestrator pipeline = makePipeline(backend);

        std::vector<std::vector<uint8_t>> inputs;
        std::vector<std::vector<uint8_t>> expected;
        for (unsigned int i = 0; i < 4; ++i) {
            inputs.push_back(makeSineWav(44100, 1, 100 + 300 * i, 300.0 + 100 * i));
            expected.push_back(pipeline.process(inputs.back()));
        }

        std::vector<std::vector<uint8_t>> actual(inputs.size());
        std::vector<std::thread> threads;
        for (size_t i = 0; i < inputs.size(); ++i) {
            threads.emplace_back([&, i]() { actual[i] = pipeline.process(inputs[i]); });
        }
        for (auto& t : threads) t.join();

        for (size_t i = 0; i < inputs.size(); ++i) {
            ASSERT_TRUE(actual[i] == expected[i], "Request " + std::to_string(i));
        }
    }
};

// ============================================================================
// Failures
// ============================================================================

class StageErrorKindTest : public TestCase {
public:
    StageErrorKindTest() : TestCase("Stage failures surface as PipelineError with their kind") {}

protected:
    void runTest() override {
        const std::vector<uint8_t> wav = makeSineWav(8000, 1, 100);

        MockCodecBackend::Config decode_fail;
        decode_fail.fail_decode = true;
        PipelineOrchestrator p1 = makePipeline(std::make_shared<MockCodecBackend>(decode_fail));
        auto kind = pipelineErrorKind([&]() { p1.process(wav); });
        ASSERT_TRUE(kind && *kind == ErrorKind::Decode, "Decode");

        MockCodecBackend::Config encode_fail;
        encode_fail.fail_encode = true;
        PipelineOrchestrator p2 = makePipeline(std::make_shared<MockCodecBackend>(encode_fail));
        kind = pipelineErrorKind([&]() { p2.process(wav); });
        ASSERT_TRUE(kind && *kind == ErrorKind::Encode, "Encode");

        MockCodecBackend::Config garbage;
        garbage.emit_garbage = true;
        PipelineOrchestrator p3 = makePipeline(std::make_shared<MockCodecBackend>(garbage));
        kind = pipelineErrorKind([&]() { p3.process(wav); });
        ASSERT_TRUE(kind && *kind == ErrorKind::MalformedStream, "MalformedStream");

        MockCodecBackend::Config slow;
        slow.decode_delay = 300ms;
        PipelineOrchestrator p4 = makePipeline(std::make_shared<MockCodecBackend>(slow), 30ms);
        kind = pipelineErrorKind([&]() { p4.process(wav); });
        ASSERT_TRUE(kind && *kind == ErrorKind::Timeout, "Timeout");
    }
};

class UndecodableInputTest : public TestCase {
public:
    UndecodableInputTest() : TestCase("Empty and unknown input are decode errors") {}

protected:
    void runTest() override {
        PipelineOrchestrator pipeline = makePipeline(std::make_shared<MockCodecBackend>());

        auto kind = pipelineErrorKind([&]() { pipeline.process(std::vector<uint8_t>()); });
        ASSERT_TRUE(kind && *kind == ErrorKind::Decode, "Empty input");

        std::vector<uint8_t> text(1000, 'x');
        kind = pipelineErrorKind([&]() { pipeline.process(text, std::string("wav")); });
        ASSERT_TRUE(kind && *kind == ErrorKind::Decode, "Not audio, even with a hint");

        try {
            pipeline.process(text);
            ASSERT_TRUE(false, "Expected PipelineError");
        } catch (const PipelineError& e) {
            ASSERT_EQUALS(std::string("DecodeError"), std::string(Hushmark::Core::errorKindName(e.kind())),
                          "Kind name");
            ASSERT_TRUE(std::string(e.what()).find("unknown") != std::string::npos, "Stage message kept");
        }
    }
};

class ConfigConstructionTest : public TestCase {
public:
    ConfigConstructionTest() : TestCase("Config builds the selected backend") {}

protected:
    void runTest() override {
        Config config;
        config.codec_backend = CodecBackendKind::Subprocess;
        config.ffmpeg_path = "/nonexistent/ffmpeg";
        config.codec_timeout_ms = 2000;
        config.worker_threads = 1;

        PipelineOrchestrator pipeline(config);
        ASSERT_EQUALS(std::string("subprocess"), std::string(pipeline.standardizer().backend().name()), "Backend");
        ASSERT_EQUALS(2000, static_cast<int>(pipeline.standardizer().timeout().count()), "Timeout");

        auto kind = pipelineErrorKind([&]() { pipeline.process(makeSineWav(8000, 1, 50)); });
        ASSERT_TRUE(kind && *kind == ErrorKind::Decode, "Missing ffmpeg is a decode error");

        Config library;
        ASSERT_EQUALS(std::string("library"),
                      std::string(PipelineOrchestrator::makeBackend(library)->name()), "Default backend");

        Config no_literal;
        no_literal.literal_check = false;
        no_literal.extra_tokens = {"VendorX"};
        PipelineOrchestrator quiet(no_literal);
        ASSERT_FALSE(quiet.sanitizer().literalCheckEnabled(), "Literal check off");
        ASSERT_EQUALS(SignatureSanitizer::defaultTokens().size() + 1, quiet.sanitizer().tokens().size(),
                      "Extra token added");
    }
};

class StandardizerArgumentsTest : public TestCase {
public:
    StandardizerArgumentsTest() : TestCase("Standardizer rejects bad wiring") {}

protected:
    void runTest() override {
        auto pool = std::make_shared<CodecWorkerPool>(1, 1);
        auto backend = std::make_shared<MockCodecBackend>();

        TestPatterns::assertThrows<std::invalid_argument>(
            [&]() { FormatStandardizer s(nullptr, pool, ConditioningOptions(), 1000ms); });
        TestPatterns::assertThrows<std::invalid_argument>(
            [&]() { FormatStandardizer s(backend, nullptr, ConditioningOptions(), 1000ms); });

        ConditioningOptions wrong_rate;
        wrong_rate.target_rate = 48000;
        TestPatterns::assertThrows<std::invalid_argument>(
            [&]() { FormatStandardizer s(backend, pool, wrong_rate, 1000ms); }, "44100");

        TestPatterns::assertThrows<std::invalid_argument>(
            [&]() { PipelineOrchestrator p(nullptr, SignatureSanitizer()); });

        FormatStandardizer standardizer(backend, pool, ConditioningOptions(), 1000ms);
        TestPatterns::assertThrows<EncodeError>(
            [&]() { standardizer.encode(PCMStream()); }, "cannot condition");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Pipeline Orchestrator Tests");

    suite.addTest(std::make_unique<ProcessCleansVendorStreamTest>());
    suite.addTest(std::make_unique<ConditioningReachesEncoderTest>());
    suite.addTest(std::make_unique<HintFallbackTest>());
    suite.addTest(std::make_unique<TransportTest>());
    suite.addTest(std::make_unique<ConcurrentRequestsTest>());
    suite.addTest(std::make_unique<StageErrorKindTest>());
    suite.addTest(std::make_unique<UndecodableInputTest>());
    suite.addTest(std::make_unique<ConfigConstructionTest>());
    suite.addTest(std::make_unique<StandardizerArgumentsTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
