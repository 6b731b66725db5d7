// dsp/reverb.h - Schroeder reverb (8 parallel combs → 4 serial allpasses)
#pragma once

#include "effect.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <vector>

namespace adfx {

struct ReverbConfig {
    float room_size = 0.5f;   // 0.0 → 1.0, drives comb feedback
    float damping   = 0.5f;   // 0.0 → 1.0, high-frequency loss in the combs
    float mix       = 0.3f;   // wet/dry
};

// ── Delay line with its own cursor ────────────────────────────────────────
struct ReverbLine {
    std::vector<float> buf;
    size_t             pos = 0;

    void clear()
    {
        std::fill(buf.begin(), buf.end(), 0.0f);
        pos = 0;
    }
};

// ---------------------------------------------------------------------------
// DspReverb
// ---------------------------------------------------------------------------
class DspReverb : public EffectUnit {
public:
    static constexpr int   NUM_COMBS      = 8;
    static constexpr int   NUM_ALLPASSES  = 4;
    static constexpr float ALLPASS_COEFF  = 0.5f;
    static constexpr int   REFERENCE_RATE = 44100;

    explicit DspReverb(int sample_rate = 44100);

    void set_config(const ReverbConfig& cfg);
    const ReverbConfig& config() const { return cfg_; }

    // Recognized: room_size, damping, mix
    void configure(const EffectParams& params) override;
    bool process(float* pcm, size_t frames) override;
    void reset() override;

    // Shared comb feedback: 0.84 + room_size · 0.1
    float comb_feedback() const { return comb_feedback_; }

    size_t comb_length(int i)    const { return combs_[i].buf.size(); }
    size_t allpass_length(int i) const { return allpasses_[i].buf.size(); }

private:
    ReverbConfig                           cfg_;
    int                                    sample_rate_;
    float                                  comb_feedback_ = 0.89f;
    std::array<ReverbLine, NUM_COMBS>      combs_;
    std::array<ReverbLine, NUM_ALLPASSES>  allpasses_;
};

} // namespace adfx
