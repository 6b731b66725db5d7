// dsp/chorus.cpp - Chorus implementation
//
// Per sample:
//   buffer[w]  = x
//   lfo        = sin(2π · phase);  phase += rate / sr  (wraps at 1.0)
//   d          = int(depth · sr · (1 + lfo) / 2), clamped to [0, len - 1]
//   out        = mix · buffer[(w - d) mod len] + (1 - mix) · x
#include "chorus.h"

#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace adfx {

DspChorus::DspChorus(int sample_rate)
    : EffectUnit(EffectId::CHORUS)
    , sample_rate_(sample_rate > 0 ? sample_rate : 44100)
{
    const size_t len = static_cast<size_t>(MAX_DELAY_SEC * static_cast<float>(sample_rate_));
    buffer_.assign(std::max<size_t>(len, 1), 0.0f);
}

void DspChorus::set_config(const ChorusConfig& cfg)
{
    cfg_.rate  = clamp_param(cfg.rate,  0.0f, MAX_RATE_HZ);
    cfg_.depth = clamp_param(cfg.depth, 0.0f, MAX_DELAY_SEC);
    cfg_.mix   = clamp_param(cfg.mix,   0.0f, 1.0f);
}

void DspChorus::configure(const EffectParams& params)
{
    ChorusConfig cfg = cfg_;
    params.get("rate",  cfg.rate);
    params.get("depth", cfg.depth);
    params.get("mix",   cfg.mix);
    set_config(cfg);
}

void DspChorus::reset()
{
    std::fill(buffer_.begin(), buffer_.end(), 0.0f);
    write_pos_ = 0;
    lfo_phase_ = 0.0f;
}

bool DspChorus::process(float* pcm, size_t frames)
{
    if (!pcm) return frames == 0;

    const size_t len        = buffer_.size();
    const float  sr         = static_cast<float>(sample_rate_);
    const float  phase_step = cfg_.rate / sr;
    const float  depth_smp  = cfg_.depth * sr;
    const float  wet        = cfg_.mix;
    const float  dry        = 1.0f - cfg_.mix;
    const float  two_pi     = 2.0f * static_cast<float>(M_PI);

    for (size_t i = 0; i < frames; i++) {
        const float x = pcm[i];
        buffer_[write_pos_] = x;

        const float lfo = std::sin(two_pi * lfo_phase_);
        lfo_phase_ += phase_step;
        if (lfo_phase_ >= 1.0f) lfo_phase_ -= 1.0f;

        long delay = static_cast<long>(depth_smp * (1.0f + lfo) / 2.0f);
        delay = std::clamp(delay, 0L, static_cast<long>(len) - 1);

        const size_t read_pos = (write_pos_ + len - static_cast<size_t>(delay)) % len;
        pcm[i] = wet * buffer_[read_pos] + dry * x;

        write_pos_ = (write_pos_ + 1) % len;
    }
    return true;
}

} // namespace adfx
