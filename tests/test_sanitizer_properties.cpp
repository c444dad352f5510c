/*
 * test_sanitizer_properties.cpp - Property-based tests for parsing and sanitization
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"
#include "test_fixtures.h"

#include <rapidcheck.h>

using namespace TestFixtures;
using namespace Hushmark::MPEG;
using Hushmark::Sanitizer::SignatureSanitizer;

namespace {

// Arbitrary bytes that can never start a frame sync
rc::Gen<std::vector<uint8_t>> genGap(size_t max_size)
{
    return rc::gen::mapcat(rc::gen::inRange<size_t>(0, max_size + 1), [](size_t n) {
        return rc::gen::container<std::vector<uint8_t>>(n, rc::gen::inRange<uint8_t>(0x00, 0xFF));
    });
}

// Printable text, the shape most vendor strings take
rc::Gen<std::string> genText()
{
    return rc::gen::mapcat(rc::gen::inRange<size_t>(4, 40), [](size_t n) {
        return rc::gen::container<std::string>(n, rc::gen::inRange<char>(0x20, 0x7F));
    });
}

struct Sample {
    std::vector<uint8_t> bytes;
    FrameIndex index;
};

// Frames with a leading gap, text runs spliced into it, and optional tags
Sample genSample()
{
    Sample s;
    std::vector<uint8_t> lead = *genGap(64);
    const size_t runs = *rc::gen::inRange<size_t>(0, 3);
    for (size_t i = 0; i < runs; ++i) {
        std::string text = *genText();
        size_t at = lead.empty() ? 0 : *rc::gen::inRange<size_t>(0, lead.size() + 1);
        lead.insert(lead.begin() + at, text.begin(), text.end());
    }
    if (*rc::gen::arbitrary<bool>()) {
        s.bytes = makeID3v2Tag({{"TPE1", *genText()}});
    }
    append(s.bytes, lead);
    if (*rc::gen::arbitrary<bool>()) {
        append(s.bytes, makeInfoFrame(*rc::gen::element("Xing", "Info")));
    }
    append(s.bytes, makeStream(*rc::gen::inRange<size_t>(1, 8)));
    if (*rc::gen::arbitrary<bool>()) {
        append(s.bytes, makeAPETag("Comment", *genText()));
    }
    if (*rc::gen::arbitrary<bool>()) {
        append(s.bytes, makeID3v1Tag(*genText(), "ContentProducer"));
    }
    s.index = StructuralFrameParser().parse(s.bytes);
    return s;
}

bool hasTextRun(const std::vector<uint8_t>& data, size_t start, size_t end)
{
    size_t run = 0;
    for (size_t i = start; i < end; ++i) {
        run = SignatureSanitizer::isPrintable(data[i]) ? run + 1 : 0;
        if (run >= SignatureSanitizer::MIN_TEXT_RUN) return true;
    }
    return false;
}

} // anonymous namespace

int main() {
    std::cout << "=== Sanitizer Property-Based Tests ===" << std::endl;

    bool all_passed = true;

    std::cout << "\nProperty 1: Index entries tile the whole buffer" << std::endl;
    all_passed &= rc::check("Regions and frames partition [0, len)", []() {
        Sample s = genSample();
        RC_ASSERT(s.index.partitions(s.bytes.size()));
        RC_ASSERT(s.index.frameCount() >= 1);
    });

    std::cout << "\nProperty 2: Length and frame bytes are preserved" << std::endl;
    all_passed &= rc::check("len(sanitize(x)) == len(x), frames byte-identical", []() {
        Sample s = genSample();
        std::vector<uint8_t> out = SignatureSanitizer().sanitize(s.bytes, s.index);
        RC_ASSERT(out.size() == s.bytes.size());
        RC_ASSERT(frameBytes(out, s.index) == frameBytes(s.bytes, s.index));
    });

    std::cout << "\nProperty 3: Sanitizing twice equals sanitizing once" << std::endl;
    all_passed &= rc::check("sanitize(sanitize(x)) == sanitize(x)", []() {
        Sample s = genSample();
        SignatureSanitizer sanitizer(*rc::gen::arbitrary<bool>());
        std::vector<uint8_t> once = sanitizer.sanitize(s.bytes, s.index);
        RC_ASSERT(sanitizer.sanitize(once, s.index) == once);
    });

    std::cout << "\nProperty 4: No printable run of four survives outside frames" << std::endl;
    all_passed &= rc::check("Text runs neutralized", []() {
        Sample s = genSample();
        std::vector<uint8_t> out = SignatureSanitizer(false).sanitize(s.bytes, s.index);
        for (const auto& region : s.index.regions()) {
            size_t start = region.sanitizableOffset();
            RC_ASSERT(!hasTextRun(out, start, start + region.sanitizableLength()));
        }
    });

    std::cout << "\nProperty 5: Known encoder and AIGC tokens are absent outside frames" << std::endl;
    all_passed &= rc::check("LAME, Xing, ContentProducer absent", []() {
        Sample s = genSample();
        std::vector<uint8_t> out = SignatureSanitizer().sanitize(s.bytes, s.index);
        for (const auto& region : s.index.regions()) {
            std::vector<uint8_t> bytes(out.begin() + region.sanitizableOffset(),
                                       out.begin() + region.sanitizableOffset() + region.sanitizableLength());
            RC_ASSERT(!contains(bytes, "LAME"));
            RC_ASSERT(!contains(bytes, "Xing"));
            RC_ASSERT(!contains(bytes, "ContentProducer"));
        }
    });

    std::cout << "\n=== Summary ===" << std::endl;
    if (all_passed) {
        std::cout << "All property tests PASSED" << std::endl;
        return 0;
    } else {
        std::cout << "Some property tests FAILED" << std::endl;
        return 1;
    }
}
