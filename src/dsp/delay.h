// dsp/delay.h - Feedback delay / echo (circular buffer, up to 2 s)
#pragma once

#include "effect.h"

#include <cstddef>
#include <vector>

namespace adfx {

struct DelayConfig {
    float delay_time = 0.3f;   // seconds
    float feedback   = 0.4f;   // 0.0 → 0.95
    float mix        = 0.3f;   // wet/dry
};

// ---------------------------------------------------------------------------
// DspDelay
// ---------------------------------------------------------------------------
class DspDelay : public EffectUnit {
public:
    static constexpr float MAX_DELAY_SEC = 2.0f;
    static constexpr float MAX_FEEDBACK  = 0.95f;

    explicit DspDelay(int sample_rate = 44100);

    void set_config(const DelayConfig& cfg);
    const DelayConfig& config() const { return cfg_; }

    // Recognized: delay_time (s), delay_samples, feedback, mix.
    // delay_samples wins over delay_time when both are given.
    void configure(const EffectParams& params) override;
    bool process(float* pcm, size_t frames) override;
    void reset() override;

    // Set the delay length directly in samples (clamped to [1, len - 1])
    void set_delay_samples(long samples);

    size_t delay_samples() const { return delay_samples_; }
    size_t buffer_length() const { return buffer_.size(); }
    int    sample_rate()   const { return sample_rate_; }

private:
    DelayConfig        cfg_;
    int                sample_rate_;
    std::vector<float> buffer_;
    size_t             write_pos_     = 0;
    size_t             delay_samples_ = 1;

    void set_delay_length(float samples);
};

} // namespace adfx
