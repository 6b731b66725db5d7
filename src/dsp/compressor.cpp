// dsp/compressor.cpp - Compressor implementation
//
// Algorithm: feedforward peak detection with separate attack/release
// envelope coefficients, static threshold/ratio curve in the dB domain,
// makeup gain as a plain multiplier.
#include "compressor.h"

#include <algorithm>
#include <cmath>

namespace adfx {

float envelope_coeff(float time_sec, int sample_rate)
{
    const float t  = std::max(DspCompressor::MIN_TIME_SEC, time_sec);
    const float sr = static_cast<float>(sample_rate > 0 ? sample_rate : 44100);
    return std::exp(-1.0f / (t * sr));
}

DspCompressor::DspCompressor(int sample_rate)
    : EffectUnit(EffectId::COMPRESSOR)
    , sample_rate_(sample_rate > 0 ? sample_rate : 44100)
{
    update_coeffs();
}

void DspCompressor::update_coeffs()
{
    attack_coeff_  = envelope_coeff(cfg_.attack_sec,  sample_rate_);
    release_coeff_ = envelope_coeff(cfg_.release_sec, sample_rate_);
}

void DspCompressor::set_config(const CompressorConfig& cfg)
{
    cfg_.threshold_db = clamp_param(cfg.threshold_db, -96.0f, 0.0f);
    cfg_.ratio        = clamp_param(cfg.ratio,        1.0f, MAX_RATIO);
    cfg_.attack_sec   = std::max(MIN_TIME_SEC, cfg.attack_sec);
    cfg_.release_sec  = std::max(MIN_TIME_SEC, cfg.release_sec);
    cfg_.makeup_gain  = clamp_param(cfg.makeup_gain,  0.0f, MAX_MAKEUP);
    update_coeffs();
}

void DspCompressor::configure(const EffectParams& params)
{
    CompressorConfig cfg = cfg_;
    params.get("threshold",   cfg.threshold_db);
    params.get("ratio",       cfg.ratio);
    params.get("makeup_gain", cfg.makeup_gain);
    params.get("attack",      cfg.attack_sec);
    params.get("release",     cfg.release_sec);
    set_config(cfg);
}

// Above threshold the output level is threshold + over / ratio; the returned
// value is the difference to the input level (0 below threshold).
float DspCompressor::compute_gain_db(float level_db) const
{
    if (level_db <= cfg_.threshold_db) return 0.0f;
    const float target_db = cfg_.threshold_db + (level_db - cfg_.threshold_db) / cfg_.ratio;
    return target_db - level_db;
}

bool DspCompressor::process(float* pcm, size_t frames)
{
    if (!pcm) return frames == 0;

    const float makeup = cfg_.makeup_gain;

    for (size_t i = 0; i < frames; i++) {
        const float level = std::fabs(pcm[i]);

        const float coeff = (level > envelope_) ? attack_coeff_ : release_coeff_;
        envelope_ = coeff * envelope_ + (1.0f - coeff) * level;

        const float env_db = 20.0f * std::log10(envelope_ + 1e-10f);
        gain_reduction_db_ = compute_gain_db(env_db);

        const float gain = std::pow(10.0f, gain_reduction_db_ / 20.0f);
        pcm[i] *= gain * makeup;
    }
    return true;
}

} // namespace adfx
