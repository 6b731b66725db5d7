// dsp/chorus.h - Single-voice chorus (sine-modulated delay line)
#pragma once

#include "effect.h"

#include <cstddef>
#include <vector>

namespace adfx {

struct ChorusConfig {
    float rate  = 1.5f;     // LFO rate (Hz)
    float depth = 0.003f;   // modulation depth (seconds)
    float mix   = 0.5f;     // wet/dry
};

// ---------------------------------------------------------------------------
// DspChorus
// ---------------------------------------------------------------------------
class DspChorus : public EffectUnit {
public:
    // Delay buffer length (seconds); also the upper bound for depth
    static constexpr float MAX_DELAY_SEC = 0.05f;
    static constexpr float MAX_RATE_HZ   = 20.0f;

    explicit DspChorus(int sample_rate = 44100);

    void set_config(const ChorusConfig& cfg);
    const ChorusConfig& config() const { return cfg_; }

    // Recognized: rate, depth, mix
    void configure(const EffectParams& params) override;
    bool process(float* pcm, size_t frames) override;
    void reset() override;

    int    sample_rate()   const { return sample_rate_; }
    size_t buffer_length() const { return buffer_.size(); }
    float  lfo_phase()     const { return lfo_phase_; }

private:
    ChorusConfig       cfg_;
    int                sample_rate_;
    std::vector<float> buffer_;
    size_t             write_pos_ = 0;
    float              lfo_phase_ = 0.0f;   // 0.0 → 1.0
};

} // namespace adfx
