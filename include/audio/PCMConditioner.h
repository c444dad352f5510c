/*
 * PCMConditioner.h - Channel, rate and level conditioning of PCM audio
 * This file is part of Hushmark.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Hushmark is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HUSHMARK_AUDIO_PCMCONDITIONER_H
#define HUSHMARK_AUDIO_PCMCONDITIONER_H

// No direct includes - all includes should be in hushmark.h

namespace Hushmark {
namespace Audio {

struct ConditioningOptions {
    unsigned int target_rate = 44100;
    bool normalize = true;
    double headroom_db = 0.1;   // peak lands at -headroom_db dBFS
    double highpass_hz = 20.0;  // 0 disables the filter
};

/**
 * @brief Brings any decoded PCMStream to the canonical shape handed to the
 * encoder: mono, target_rate, 16-bit.
 *
 * Order is down-mix, resample, high-pass, then peak normalization, so the
 * normalized peak is the one the encoder actually sees.
 */
class PCMConditioner {
public:
    explicit PCMConditioner(ConditioningOptions options = ConditioningOptions());

    PCMStream condition(const PCMStream& input) const;

    const ConditioningOptions& options() const { return m_options; }

    static PCMStream downmixToMono(const PCMStream& input);
    static PCMStream resample(const PCMStream& input, unsigned int target_rate);
    static void highPass(std::vector<int16_t>& samples, unsigned int sample_rate, double cutoff_hz);
    static void normalizePeak(std::vector<int16_t>& samples, double headroom_db);

private:
    ConditioningOptions m_options;
};

} // namespace Audio
} // namespace Hushmark

using Hushmark::Audio::PCMConditioner;
using Hushmark::Audio::ConditioningOptions;

#endif // HUSHMARK_AUDIO_PCMCONDITIONER_H
