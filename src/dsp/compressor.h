// dsp/compressor.h - Feedforward peak compressor with makeup gain
#pragma once

#include "effect.h"

#include <cstddef>

namespace adfx {

struct CompressorConfig {
    // Compression threshold in dBFS (gain reduction starts here)
    float threshold_db = -20.0f;
    // Compression ratio (e.g. 4.0 = 4:1 - for every 4dB over threshold, output rises 1dB)
    float ratio        =   4.0f;
    // Envelope attack: how fast the detector follows a rising level (seconds)
    float attack_sec   =   0.005f;
    // Envelope release: how fast the detector falls back (seconds)
    float release_sec  =   0.1f;
    // Post-compression makeup gain (linear multiplier)
    float makeup_gain  =   1.0f;
};

// ---------------------------------------------------------------------------
// DspCompressor - one-pole envelope follower driving static gain reduction
// ---------------------------------------------------------------------------
class DspCompressor : public EffectUnit {
public:
    static constexpr float MIN_TIME_SEC = 1e-5f;
    static constexpr float MAX_RATIO    = 100.0f;
    static constexpr float MAX_MAKEUP   = 16.0f;

    explicit DspCompressor(int sample_rate = 44100);

    void set_config(const CompressorConfig& cfg);
    const CompressorConfig& config() const { return cfg_; }

    // Recognized: threshold, ratio, makeup_gain, attack, release
    void configure(const EffectParams& params) override;
    bool process(float* pcm, size_t frames) override;

    // Reset envelope state (call on discontinuity / profile switch)
    void reset() override { envelope_ = 0.0f; gain_reduction_db_ = 0.0f; }

    float envelope() const { return envelope_; }

    // Gain reduction of the last processed sample in dB (<= 0, for metering)
    float gain_reduction_db() const { return gain_reduction_db_; }

    // Static curve: gain change in dB for a detector level in dB
    float compute_gain_db(float level_db) const;

private:
    CompressorConfig cfg_;
    int              sample_rate_;
    float            attack_coeff_      = 0.0f;
    float            release_coeff_     = 0.0f;
    float            envelope_          = 0.0f;
    float            gain_reduction_db_ = 0.0f;

    void update_coeffs();
};

// One-pole smoothing coefficient: exp(-1 / (tau · sr))
float envelope_coeff(float time_sec, int sample_rate);

} // namespace adfx
