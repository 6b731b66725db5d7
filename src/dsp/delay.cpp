// dsp/delay.cpp - Feedback delay implementation
#include "delay.h"

#include <algorithm>
#include <cmath>

namespace adfx {

DspDelay::DspDelay(int sample_rate)
    : EffectUnit(EffectId::DELAY)
    , sample_rate_(sample_rate > 0 ? sample_rate : 44100)
{
    const size_t len = static_cast<size_t>(MAX_DELAY_SEC * static_cast<float>(sample_rate_));
    buffer_.assign(std::max<size_t>(len, 2), 0.0f);
    set_config(cfg_);
}

void DspDelay::set_delay_samples(long samples)
{
    const long max_delay = static_cast<long>(buffer_.size()) - 1;
    delay_samples_ = static_cast<size_t>(std::clamp(samples, 1L, max_delay));
    cfg_.delay_time = static_cast<float>(delay_samples_) / static_cast<float>(sample_rate_);
}

// Clamp while still in float: lround() has no defined result beyond the range of long
void DspDelay::set_delay_length(float samples)
{
    const float max_delay = static_cast<float>(buffer_.size() - 1);
    set_delay_samples(std::lround(clamp_param(samples, 1.0f, max_delay)));
}

void DspDelay::set_config(const DelayConfig& cfg)
{
    cfg_.feedback = clamp_param(cfg.feedback, 0.0f, MAX_FEEDBACK);
    cfg_.mix      = clamp_param(cfg.mix,      0.0f, 1.0f);

    set_delay_length(cfg.delay_time * static_cast<float>(sample_rate_));
}

void DspDelay::configure(const EffectParams& params)
{
    DelayConfig cfg = cfg_;
    params.get("delay_time", cfg.delay_time);
    params.get("feedback",   cfg.feedback);
    params.get("mix",        cfg.mix);
    set_config(cfg);

    float samples = 0.0f;
    if (params.get("delay_samples", samples))
        set_delay_length(samples);
}

void DspDelay::reset()
{
    std::fill(buffer_.begin(), buffer_.end(), 0.0f);
    write_pos_ = 0;
}

bool DspDelay::process(float* pcm, size_t frames)
{
    if (!pcm) return frames == 0;

    const size_t len      = buffer_.size();
    const size_t delay    = delay_samples_;
    const float  feedback = cfg_.feedback;
    const float  wet      = cfg_.mix;
    const float  dry      = 1.0f - cfg_.mix;

    for (size_t i = 0; i < frames; i++) {
        const float x       = pcm[i];
        const float delayed = buffer_[(write_pos_ + len - delay) % len];

        buffer_[write_pos_] = x + delayed * feedback;
        pcm[i] = dry * x + wet * delayed;

        write_pos_ = (write_pos_ + 1) % len;
    }
    return true;
}

} // namespace adfx
