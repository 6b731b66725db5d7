// dsp/reverb.cpp - Schroeder reverb implementation
//
// Comb/allpass lengths are the classic 44.1 kHz tunings scaled to the
// running sample rate.  Each comb blends its delayed sample with a
// feedback-attenuated copy (damping) before writing back; the combs are
// averaged and diffused through four allpasses with g = 0.5.
#include "reverb.h"

#include <algorithm>

namespace adfx {

namespace {

constexpr int kCombTuning[DspReverb::NUM_COMBS] = {
    1557, 1617, 1491, 1422, 1277, 1356, 1188, 1116,
};

constexpr int kAllpassTuning[DspReverb::NUM_ALLPASSES] = {
    225, 556, 441, 341,
};

size_t scaled_length(int tuning, int sample_rate)
{
    const long n = static_cast<long>(sample_rate) * tuning / DspReverb::REFERENCE_RATE;
    return static_cast<size_t>(std::max(n, 1L));
}

} // namespace

DspReverb::DspReverb(int sample_rate)
    : EffectUnit(EffectId::REVERB)
    , sample_rate_(sample_rate > 0 ? sample_rate : 44100)
{
    for (int i = 0; i < NUM_COMBS; i++)
        combs_[i].buf.assign(scaled_length(kCombTuning[i], sample_rate_), 0.0f);
    for (int i = 0; i < NUM_ALLPASSES; i++)
        allpasses_[i].buf.assign(scaled_length(kAllpassTuning[i], sample_rate_), 0.0f);

    set_config(cfg_);
}

void DspReverb::set_config(const ReverbConfig& cfg)
{
    cfg_.room_size = clamp_param(cfg.room_size, 0.0f, 1.0f);
    cfg_.damping   = clamp_param(cfg.damping,   0.0f, 1.0f);
    cfg_.mix       = clamp_param(cfg.mix,       0.0f, 1.0f);
    comb_feedback_ = 0.84f + cfg_.room_size * 0.1f;
}

void DspReverb::configure(const EffectParams& params)
{
    ReverbConfig cfg = cfg_;
    params.get("room_size", cfg.room_size);
    params.get("damping",   cfg.damping);
    params.get("mix",       cfg.mix);
    set_config(cfg);
}

void DspReverb::reset()
{
    for (auto& c : combs_)     c.clear();
    for (auto& a : allpasses_) a.clear();
}

bool DspReverb::process(float* pcm, size_t frames)
{
    if (!pcm) return frames == 0;

    const float fb      = comb_feedback_;
    const float damping = cfg_.damping;
    const float wet     = cfg_.mix;
    const float dry     = 1.0f - cfg_.mix;

    for (size_t i = 0; i < frames; i++) {
        const float x = pcm[i];

        float comb_sum = 0.0f;
        for (auto& c : combs_) {
            const float delayed  = c.buf[c.pos];
            const float filtered = delayed * (1.0f - damping) + fb * delayed * damping;
            c.buf[c.pos] = x + filtered * fb;
            c.pos = (c.pos + 1) % c.buf.size();
            comb_sum += delayed;
        }

        float ap_out = comb_sum / static_cast<float>(NUM_COMBS);
        for (auto& a : allpasses_) {
            const float delayed = a.buf[a.pos];
            a.buf[a.pos] = ap_out + delayed * ALLPASS_COEFF;
            ap_out = delayed - ap_out * ALLPASS_COEFF;
            a.pos = (a.pos + 1) % a.buf.size();
        }

        pcm[i] = dry * x + wet * ap_out;
    }
    return true;
}

} // namespace adfx
