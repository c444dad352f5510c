/*
 * main.cpp - contains main(), mostly.
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

#include "hushmark.h"
#include <getopt.h>

static const int EXIT_USAGE = 1;
static const int EXIT_PIPELINE = 2;

static void usage(const char *argv0)
{
    std::cerr << "Usage: " << argv0 << " [options] INPUT OUTPUT\n"
              << "  -c, --config FILE     read settings from FILE\n"
              << "  -f, --format HINT     declared input format (extension or MIME type)\n"
              << "  -b, --base64          INPUT and OUTPUT hold base64 text\n"
              << "  -t, --timeout MS      per codec call timeout\n"
              << "  -s, --subprocess      use the ffmpeg subprocess backend\n"
              << "  -d, --debug CHANNELS  enable debug channels (comma separated, or 'all')\n"
              << "  -l, --logfile FILE    write debug output to FILE\n"
              << "  -k, --chunk MS        write WAV chunks of MS milliseconds instead\n"
              << "  -v, --version         print version and exit\n";
}

static void about()
{
    std::cout << "Hushmark " << HUSHMARK_VERSION << std::endl
              << "Maintainer: " << HUSHMARK_MAINTAINER << std::endl
              << "Output profile: MPEG-1 Layer III, " << Hushmark::Codec::EncoderProfile::SAMPLE_RATE
              << " Hz, mono, " << Hushmark::Codec::EncoderProfile::BITRATE_KBPS << " kbps CBR" << std::endl;
}

static bool readWholeFile(const std::string& path, std::vector<uint8_t>& out)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

static bool writeWholeFile(const std::string& path, const uint8_t *data, size_t size)
{
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(size));
    return out.good();
}

// OUTPUT.wav -> OUTPUT_000.wav, OUTPUT_001.wav, ...
static std::string chunkPath(const std::string& output, size_t n)
{
    std::string stem = output;
    size_t dot = stem.find_last_of('.');
    size_t slash = stem.find_last_of('/');
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        stem.erase(dot);
    }
    char suffix[32];
    snprintf(suffix, sizeof(suffix), "_%03zu.wav", n);
    return stem + suffix;
}

int main(int argc, char *argv[]) {
    std::string config_file;
    std::optional<std::string> format_hint;
    bool base64 = false;
    unsigned int chunk_ms = 0;
    // Applied after the config file so the command line wins
    std::vector<std::pair<std::string, std::string>> overrides;

    static const struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"format", required_argument, 0, 'f'},
        {"base64", no_argument, 0, 'b'},
        {"timeout", required_argument, 0, 't'},
        {"subprocess", no_argument, 0, 's'},
        {"debug", required_argument, 0, 'd'},
        {"logfile", required_argument, 0, 'l'},
        {"chunk", required_argument, 0, 'k'},
        {"version", no_argument, 0, 'v'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:f:bt:sd:l:k:v", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                config_file = optarg;
                break;
            case 'f':
                format_hint = std::string(optarg);
                break;
            case 'b':
                base64 = true;
                break;
            case 't':
                overrides.emplace_back("codec_timeout_ms", optarg);
                break;
            case 's':
                overrides.emplace_back("codec_backend", "subprocess");
                break;
            case 'd':
                overrides.emplace_back("debug_channels", optarg);
                break;
            case 'l':
                overrides.emplace_back("log_file", optarg);
                break;
            case 'k': {
                char *end = nullptr;
                unsigned long ms = strtoul(optarg, &end, 10);
                if (*optarg == '\0' || *end != '\0' || ms == 0 || ms > UINT_MAX) {
                    std::cerr << argv[0] << ": invalid chunk duration: " << optarg << std::endl;
                    return EXIT_USAGE;
                }
                chunk_ms = static_cast<unsigned int>(ms);
                break;
            }
            case 'v':
                about();
                return 0;
            case '?': // Invalid option
                usage(argv[0]);
                return EXIT_USAGE; // getopt_long already prints an error message.
        }
    }

    if (argc - optind != 2) {
        usage(argv[0]);
        return EXIT_USAGE;
    }
    const std::string input_path = argv[optind];
    const std::string output_path = argv[optind + 1];

    Config config;
    try {
        config = Config::load(config_file, overrides);
    } catch (const ConfigException& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        Debug::shutdown();
        return EXIT_USAGE;
    }

    std::vector<uint8_t> input;
    if (!readWholeFile(input_path, input)) {
        std::cerr << argv[0] << ": cannot read " << input_path << std::endl;
        Debug::shutdown();
        return EXIT_USAGE;
    }

    int status = 0;
    try {
        PipelineOrchestrator pipeline(config);

        if (chunk_ms) {
            if (base64) {
                auto decoded = Hushmark::Core::Utility::Base64::decode(std::string(input.begin(), input.end()));
                if (!decoded) {
                    throw PipelineError(ErrorKind::Transport, "input is not valid base64");
                }
                input = std::move(*decoded);
            }
            AudioChunker chunker(pipeline.standardizer());
            std::vector<std::vector<uint8_t>> chunks;
            try {
                chunks = chunker.chunk(AudioBuffer(input, format_hint), chunk_ms);
            } catch (const StageException& e) {
                throw PipelineError(e.kind(), e.what());
            }
            for (size_t i = 0; i < chunks.size(); ++i) {
                std::string path = chunkPath(output_path, i);
                if (!writeWholeFile(path, chunks[i].data(), chunks[i].size())) {
                    std::cerr << argv[0] << ": cannot write " << path << std::endl;
                    status = EXIT_USAGE;
                    break;
                }
            }
        } else if (base64) {
            std::string text = pipeline.processTransport(std::string(input.begin(), input.end()), format_hint);
            if (!writeWholeFile(output_path, reinterpret_cast<const uint8_t *>(text.data()), text.size())) {
                std::cerr << argv[0] << ": cannot write " << output_path << std::endl;
                status = EXIT_USAGE;
            }
        } else {
            std::vector<uint8_t> output = pipeline.process(input, format_hint);
            if (!writeWholeFile(output_path, output.data(), output.size())) {
                std::cerr << argv[0] << ": cannot write " << output_path << std::endl;
                status = EXIT_USAGE;
            }
        }
    } catch (const PipelineError& e) {
        // The reason may quote the input; only the kind goes to the terminal
        Debug::log("pipeline", "main(): ", e.what());
        std::cerr << argv[0] << ": pipeline failed: " << Hushmark::Core::errorKindName(e.kind()) << std::endl;
        status = EXIT_PIPELINE;
    } catch (const std::invalid_argument& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        status = EXIT_USAGE;
    }

    Debug::shutdown();
    return status;
}
