/*
 * test_pipeline_integration.cpp - End-to-end runs through the real codecs
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"
#include "test_framework.h"
#include "test_fixtures.h"

#include <FLAC++/encoder.h>
#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/audioproperties.h>
#include <taglib/tbytevector.h>
#include <taglib/tbytevectorstream.h>

using namespace TestFramework;
using namespace TestFixtures;
using namespace Hushmark::MPEG;
using Hushmark::Codec::MPG123Decoder;
using Hushmark::Codec::FLACDecoder;
using Hushmark::Sanitizer::SignatureSanitizer;

// Single pipeline on the in-process codecs, shared by every test
static const PipelineOrchestrator& libraryPipeline()
{
    static const PipelineOrchestrator pipeline{Config()};
    return pipeline;
}

// Every frame must carry the output profile
static void checkProfile(const std::vector<uint8_t>& mp3, const std::string& what)
{
    FrameIndex index = StructuralFrameParser().parse(mp3);
    ASSERT_TRUE(index.frameCount() > 0, what + ": has frames");
    ASSERT_TRUE(index.partitions(mp3.size()), what + ": index covers the output");
    for (const Frame& frame : index.frames()) {
        ASSERT_EQUALS(128000u, frame.bitrate, what + ": 128 kbps");
        ASSERT_EQUALS(44100u, frame.sample_rate, what + ": 44.1 kHz");
        ASSERT_TRUE(frame.channel_mode == ChannelMode::Mono, what + ": mono");
        ASSERT_EQUALS(3u, frame.layer, what + ": Layer III");
        ASSERT_TRUE(frame.version == MPEGVersion::MPEG1, what + ": MPEG-1");
    }
}

// Encodes 16-bit PCM to an in-memory FLAC stream, optionally dropping to
// fewer bits per sample
class MemoryFLACEncoder : public FLAC::Encoder::Stream {
public:
    std::vector<uint8_t> encode(const PCMStream& pcm, unsigned int bits = 16) {
        set_channels(pcm.channels);
        set_bits_per_sample(bits);
        set_sample_rate(pcm.sample_rate);
        set_compression_level(5);
        if (init() != FLAC__STREAM_ENCODER_INIT_STATUS_OK) {
            throw std::runtime_error("FLAC encoder init failed");
        }
        std::vector<FLAC__int32> samples(pcm.samples.begin(), pcm.samples.end());
        for (FLAC__int32& sample : samples) {
            sample /= 1 << (16 - bits);
        }
        if (!process_interleaved(samples.data(), static_cast<uint32_t>(pcm.frames())) || !finish()) {
            throw std::runtime_error("FLAC encoding failed");
        }
        return m_out;
    }

protected:
    ::FLAC__StreamEncoderWriteStatus write_callback(const FLAC__byte buffer[], size_t bytes,
                                                    uint32_t samples, uint32_t current_frame) override {
        (void)samples;
        (void)current_frame;
        m_out.insert(m_out.end(), buffer, buffer + bytes);
        return FLAC__STREAM_ENCODER_WRITE_STATUS_OK;
    }

private:
    std::vector<uint8_t> m_out;
};

// ============================================================================
// End to end
// ============================================================================

class TaggedWaveTest : public TestCase {
public:
    TaggedWaveTest() : TestCase("Tagged TTS WAV becomes a bare canonical MP3") {}

protected:
    void runTest() override {
        std::vector<uint8_t> input = makeID3v2Tag({{"TPE1", "ElevenLabs-TTS"}, {"TSSE", "Lavf58.76.100"}});
        append(input, makeSineWav(44100, 1, 1000));

        std::vector<uint8_t> out = libraryPipeline().process(input);
        checkProfile(out, "tagged wav");
        ASSERT_FALSE(contains(out, "ElevenLabs"), "Vendor name gone");
        ASSERT_FALSE(contains(out, "Lavf"), "Muxer string gone");

        PCMStream decoded = MPG123Decoder::decodeBuffer(out);
        ASSERT_EQUALS(44100u, decoded.sample_rate, "Decodes at 44.1 kHz");
        ASSERT_EQUALS(1u, decoded.channels, "Decodes to mono");
        ASSERT_TRUE(decoded.durationMs() >= 1000 && decoded.durationMs() < 1200, "About one second");

        TagLib::ByteVector bytes(reinterpret_cast<const char*>(out.data()), static_cast<unsigned int>(out.size()));
        TagLib::ByteVectorStream stream(bytes);
        TagLib::FileRef file(&stream);
        ASSERT_FALSE(file.isNull(), "TagLib reads it as MPEG audio");
        ASSERT_TRUE(file.tag() == nullptr || file.tag()->isEmpty(), "No tag TagLib can find");
        ASSERT_NOT_NULL(file.audioProperties(), "Audio properties");
        ASSERT_EQUALS(44100, file.audioProperties()->sampleRate(), "TagLib sample rate");
        ASSERT_EQUALS(1, file.audioProperties()->channels(), "TagLib channels");
        ASSERT_EQUALS(128, file.audioProperties()->bitrate(), "TagLib bitrate");
    }
};

class VaryingInputTest : public TestCase {
public:
    VaryingInputTest() : TestCase("Output profile is fixed whatever the input") {}

protected:
    void runTest() override {
        const unsigned int rates[] = {8000, 16000, 22050, 24000, 48000};
        for (unsigned int rate : rates) {
            for (unsigned int channels = 1; channels <= 2; ++channels) {
                std::string what = std::to_string(rate) + "Hz/" + std::to_string(channels) + "ch";
                checkProfile(libraryPipeline().process(makeSineWav(rate, channels, 400)), what);
            }
        }
    }
};

class FLACInputTest : public TestCase {
public:
    FLACInputTest() : TestCase("FLAC input") {}

protected:
    void runTest() override {
        MemoryFLACEncoder encoder;
        std::vector<uint8_t> flac = encoder.encode(makeSine(48000, 2, 500));
        ASSERT_TRUE(FormatDetector::sniff(flac) == AudioFormat::FLAC, "Encoder wrote FLAC");

        checkProfile(libraryPipeline().process(flac, std::string("flac")), "flac");
    }
};

class FLACLowBitDepthTest : public TestCase {
public:
    FLACLowBitDepthTest() : TestCase("8-bit FLAC scales to 16-bit") {}

protected:
    void runTest() override {
        PCMStream source = makeSine(22050, 1, 200);
        MemoryFLACEncoder encoder;
        std::vector<uint8_t> flac = encoder.encode(source, 8);

        PCMStream decoded = FLACDecoder::decodeBuffer(flac);
        ASSERT_EQUALS(source.samples.size(), decoded.samples.size(), "Sample count");
        bool saw_negative = false;
        for (size_t i = 0; i < source.samples.size(); ++i) {
            int expected = (source.samples[i] / 256) * 256;
            ASSERT_EQUALS(expected, static_cast<int>(decoded.samples[i]), "Sample " + std::to_string(i));
            saw_negative |= expected < 0;
        }
        ASSERT_TRUE(saw_negative, "Negative samples covered");

        checkProfile(libraryPipeline().process(flac), "8-bit flac");
    }
};

class MP3InputTest : public TestCase {
public:
    MP3InputTest() : TestCase("Vendor-dressed MP3 input is re-encoded clean") {}

protected:
    void runTest() override {
        std::vector<uint8_t> mp3 = makeID3v2Tag({{"TPE1", "ElevenLabs-TTS"}});
        append(mp3, libraryPipeline().process(makeSineWav(44100, 1, 600)));
        append(mp3, makeAPETag("Comment", "ContentProducer=HUABABSpeech"));
        append(mp3, makeID3v1Tag("generated", "ElevenLabs"));

        // Wrong hint on purpose: the sniffed container wins
        std::vector<uint8_t> out = libraryPipeline().process(mp3, std::string("wav"));
        checkProfile(out, "mp3");
        ASSERT_FALSE(contains(out, "ElevenLabs"), "Vendor name gone");
        ASSERT_FALSE(contains(out, "ContentProducer"), "AIGC marker gone");
        ASSERT_FALSE(contains(out, "APETAGEX"), "APE tag gone");
    }
};

// ============================================================================
// Sanitizer on real encoder output
// ============================================================================

class FrameIntegrityTest : public TestCase {
public:
    FrameIntegrityTest() : TestCase("Sanitized stream decodes to the same PCM") {}

protected:
    void runTest() override {
        std::vector<uint8_t> clean = libraryPipeline().standardizer().standardize(
            AudioBuffer(makeSineWav(44100, 1, 800, 660.0)));

        // Leading RIFF style chunk and trailing tags around untouched frames
        std::vector<uint8_t> dressed;
        Hushmark::Core::Utility::ByteOrder::appendFourCC(dressed, "LIST");
        Hushmark::Core::Utility::ByteOrder::appendLE32(dressed, 26);
        append(dressed, std::string("INFOISFT\x0e\x00\x00\x00Lavf58.76.100", 26));
        append(dressed, clean);
        append(dressed, makeAPETag("Encoder", "LAME3.100"));
        append(dressed, makeID3v1Tag("aigc", "ContentProducer"));

        FrameIndex index = StructuralFrameParser().parse(dressed);
        std::vector<uint8_t> sanitized = SignatureSanitizer().sanitize(dressed, index);

        ASSERT_EQUALS(dressed.size(), sanitized.size(), "Length preserved");
        ASSERT_TRUE(frameBytes(dressed, index) == frameBytes(sanitized, index), "Frame bytes identical");
        ASSERT_FALSE(contains(sanitized, "Lavf"), "Leading chunk cleared");
        ASSERT_FALSE(contains(sanitized, "ContentProducer"), "Trailing tag cleared");

        PCMStream expected = MPG123Decoder::decodeBuffer(clean);
        PCMStream actual = MPG123Decoder::decodeBuffer(sanitized);
        ASSERT_EQUALS(expected.samples.size(), actual.samples.size(), "Same sample count");
        ASSERT_TRUE(expected.samples == actual.samples, "Same samples");
    }
};

class IdempotentOutputTest : public TestCase {
public:
    IdempotentOutputTest() : TestCase("Pipeline output is already sanitized") {}

protected:
    void runTest() override {
        std::vector<uint8_t> out = libraryPipeline().process(makeSineWav(22050, 2, 300));
        FrameIndex index = StructuralFrameParser().parse(out);

        Hushmark::Sanitizer::SanitizeReport report;
        std::vector<uint8_t> again = SignatureSanitizer().sanitize(out, index, report);
        ASSERT_TRUE(again == out, "Second pass changes nothing");
        ASSERT_EQUALS(0u, report.total(), "Nothing neutralized");
    }
};

// ============================================================================
// Failures
// ============================================================================

class FailureKindsTest : public TestCase {
public:
    FailureKindsTest() : TestCase("Undecodable input and bad transport") {}

protected:
    void runTest() override {
        std::vector<std::pair<std::vector<uint8_t>, ErrorKind>> cases;
        cases.emplace_back(std::vector<uint8_t>(), ErrorKind::Decode);
        cases.emplace_back(std::vector<uint8_t>(4096, 0x5A), ErrorKind::Decode);
        {
            std::vector<uint8_t> aiff;
            append(aiff, std::string("FORM\x00\x00\x00\x04" "AIFF", 12));
            cases.emplace_back(aiff, ErrorKind::Decode);
        }
        {
            std::vector<uint8_t> truncated_flac;
            append(truncated_flac, std::string("fLaC\x00\x00\x00\x22", 8));
            cases.emplace_back(truncated_flac, ErrorKind::Decode);
        }

        for (size_t i = 0; i < cases.size(); ++i) {
            try {
                libraryPipeline().process(cases[i].first);
                ASSERT_TRUE(false, "Case " + std::to_string(i) + " should fail");
            } catch (const PipelineError& e) {
                ASSERT_TRUE(e.kind() == cases[i].second, "Case " + std::to_string(i) + " kind");
            }
        }

        try {
            libraryPipeline().processTransport("%%%");
            ASSERT_TRUE(false, "Bad transport should fail");
        } catch (const PipelineError& e) {
            ASSERT_TRUE(e.kind() == ErrorKind::Transport, "Transport kind");
        }
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Pipeline Integration Tests");

    suite.addTest(std::make_unique<TaggedWaveTest>());
    suite.addTest(std::make_unique<VaryingInputTest>());
    suite.addTest(std::make_unique<FLACInputTest>());
    suite.addTest(std::make_unique<FLACLowBitDepthTest>());
    suite.addTest(std::make_unique<MP3InputTest>());
    suite.addTest(std::make_unique<FrameIntegrityTest>());
    suite.addTest(std::make_unique<IdempotentOutputTest>());
    suite.addTest(std::make_unique<FailureKindsTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
