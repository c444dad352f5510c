/*
 * PCMConditioner.cpp - Channel, rate and level conditioning of PCM audio
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "hushmark.h"

namespace Hushmark {
namespace Audio {

static inline int16_t clampSample(double v)
{
    long r = std::lround(v);
    if (r > 32767) return 32767;
    if (r < -32768) return -32768;
    return static_cast<int16_t>(r);
}

PCMConditioner::PCMConditioner(ConditioningOptions options)
    : m_options(options)
{
}

PCMStream PCMConditioner::downmixToMono(const PCMStream& input)
{
    if (input.channels <= 1) return input;

    PCMStream out;
    out.sample_rate = input.sample_rate;
    out.channels = 1;
    out.bits_per_sample = 16;

    const size_t frames = input.frames();
    out.samples.resize(frames);
    const int16_t *in = input.samples.data();
    for (size_t f = 0; f < frames; ++f) {
        long sum = 0;
        for (unsigned int c = 0; c < input.channels; ++c) {
            sum += *in++;
        }
        out.samples[f] = clampSample(static_cast<double>(sum) / input.channels);
    }
    return out;
}

PCMStream PCMConditioner::resample(const PCMStream& input, unsigned int target_rate)
{
    if (input.sample_rate == target_rate || input.empty()) {
        PCMStream out = input;
        out.sample_rate = target_rate;
        return out;
    }
    if (input.sample_rate == 0 || target_rate == 0) {
        throw std::invalid_argument("resample: zero sample rate");
    }

    const unsigned int channels = input.channels;
    const size_t in_frames = input.frames();
    const size_t out_frames = static_cast<size_t>(
        (static_cast<uint64_t>(in_frames) * target_rate + input.sample_rate / 2) / input.sample_rate);

    PCMStream out;
    out.sample_rate = target_rate;
    out.channels = channels;
    out.bits_per_sample = 16;
    out.samples.resize(out_frames * channels);

    // Linear interpolation between neighbouring input frames
    const double step = static_cast<double>(input.sample_rate) / target_rate;
    for (size_t f = 0; f < out_frames; ++f) {
        double pos = f * step;
        size_t i0 = static_cast<size_t>(pos);
        if (i0 >= in_frames) i0 = in_frames - 1;
        size_t i1 = std::min(i0 + 1, in_frames - 1);
        double frac = pos - static_cast<double>(i0);
        for (unsigned int c = 0; c < channels; ++c) {
            double a = input.samples[i0 * channels + c];
            double b = input.samples[i1 * channels + c];
            out.samples[f * channels + c] = clampSample(a + (b - a) * frac);
        }
    }
    return out;
}

void PCMConditioner::highPass(std::vector<int16_t>& samples, unsigned int sample_rate, double cutoff_hz)
{
    if (cutoff_hz <= 0.0 || samples.empty() || sample_rate == 0) return;

    // First-order RC high-pass, mono only
    const double rc = 1.0 / (2.0 * M_PI * cutoff_hz);
    const double dt = 1.0 / sample_rate;
    const double alpha = rc / (rc + dt);

    double prev_in = samples[0];
    double prev_out = 0.0;
    samples[0] = 0;
    for (size_t i = 1; i < samples.size(); ++i) {
        double x = samples[i];
        double y = alpha * (prev_out + x - prev_in);
        prev_in = x;
        prev_out = y;
        samples[i] = clampSample(y);
    }
}

void PCMConditioner::normalizePeak(std::vector<int16_t>& samples, double headroom_db)
{
    int peak = 0;
    for (int16_t s : samples) {
        peak = std::max(peak, std::abs(static_cast<int>(s)));
    }
    if (peak == 0) return; // silence stays silence

    const double target = 32767.0 * std::pow(10.0, -headroom_db / 20.0);
    const double gain = target / peak;
    for (int16_t& s : samples) {
        s = clampSample(s * gain);
    }
}

PCMStream PCMConditioner::condition(const PCMStream& input) const
{
    if (input.channels == 0 || input.sample_rate == 0) {
        throw std::invalid_argument("condition: stream has no channels or sample rate");
    }

    PCMStream out = downmixToMono(input);
    out = resample(out, m_options.target_rate);
    highPass(out.samples, out.sample_rate, m_options.highpass_hz);
    if (m_options.normalize) {
        normalizePeak(out.samples, m_options.headroom_db);
    }

    Debug::log("standardizer", "conditioned ", input.channels, "ch/", input.sample_rate, "Hz, ",
               input.frames(), " frames -> mono/", out.sample_rate, "Hz, ", out.frames(), " frames");
    return out;
}

} // namespace Audio
} // namespace Hushmark
