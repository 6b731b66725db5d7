// dsp/noise_gate.cpp - Noise gate implementation
#include "noise_gate.h"
#include "compressor.h"   // envelope_coeff

#include <algorithm>
#include <cmath>

namespace adfx {

DspNoiseGate::DspNoiseGate(int sample_rate)
    : EffectUnit(EffectId::NOISE_GATE)
    , sample_rate_(sample_rate > 0 ? sample_rate : 44100)
{
    update_coeffs();
}

void DspNoiseGate::update_coeffs()
{
    attack_coeff_  = envelope_coeff(cfg_.attack_sec,  sample_rate_);
    release_coeff_ = envelope_coeff(cfg_.release_sec, sample_rate_);
}

void DspNoiseGate::set_config(const NoiseGateConfig& cfg)
{
    cfg_.threshold_db = clamp_param(cfg.threshold_db, -120.0f, 0.0f);
    cfg_.attack_sec   = std::max(DspCompressor::MIN_TIME_SEC, cfg.attack_sec);
    cfg_.release_sec  = std::max(DspCompressor::MIN_TIME_SEC, cfg.release_sec);
    update_coeffs();
}

void DspNoiseGate::configure(const EffectParams& params)
{
    NoiseGateConfig cfg = cfg_;
    params.get("threshold", cfg.threshold_db);
    params.get("attack",    cfg.attack_sec);
    params.get("release",   cfg.release_sec);
    set_config(cfg);
}

bool DspNoiseGate::process(float* pcm, size_t frames)
{
    if (!pcm) return frames == 0;

    for (size_t i = 0; i < frames; i++) {
        const float level = std::fabs(pcm[i]);

        const float env_coeff = (level > envelope_) ? attack_coeff_ : release_coeff_;
        envelope_ = env_coeff * envelope_ + (1.0f - env_coeff) * level;

        const float env_db = 20.0f * std::log10(envelope_ + 1e-10f);
        const float target = (env_db > cfg_.threshold_db) ? 1.0f : 0.0f;

        const float gate_coeff = (target > gate_gain_) ? attack_coeff_ : release_coeff_;
        gate_gain_ = gate_coeff * gate_gain_ + (1.0f - gate_coeff) * target;

        pcm[i] *= gate_gain_;
    }
    return true;
}

} // namespace adfx
