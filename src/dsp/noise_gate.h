// dsp/noise_gate.h - Envelope-driven noise gate with smoothed gate gain
#pragma once

#include "effect.h"

#include <cstddef>

namespace adfx {

struct NoiseGateConfig {
    float threshold_db = -40.0f;   // gate opens above this envelope level
    float attack_sec   =   0.001f; // how fast the gate opens
    float release_sec  =   0.05f;  // how fast the gate closes
};

// ---------------------------------------------------------------------------
// DspNoiseGate
//
// Stage 1 follows |x| with attack/release coefficients (same detector as
// DspCompressor).  Stage 2 smooths a binary open/closed target with the
// attack coefficient while opening and the release coefficient while
// closing, so the applied gain moves continuously between 0 and 1.
// ---------------------------------------------------------------------------
class DspNoiseGate : public EffectUnit {
public:
    explicit DspNoiseGate(int sample_rate = 44100);

    void set_config(const NoiseGateConfig& cfg);
    const NoiseGateConfig& config() const { return cfg_; }

    // Recognized: threshold, attack, release
    void configure(const EffectParams& params) override;
    bool process(float* pcm, size_t frames) override;
    void reset() override { envelope_ = 0.0f; gate_gain_ = 0.0f; }

    float envelope()  const { return envelope_; }
    float gate_gain() const { return gate_gain_; }

private:
    NoiseGateConfig cfg_;
    int             sample_rate_;
    float           attack_coeff_  = 0.0f;
    float           release_coeff_ = 0.0f;
    float           envelope_      = 0.0f;
    float           gate_gain_     = 0.0f;   // starts closed

    void update_coeffs();
};

} // namespace adfx
