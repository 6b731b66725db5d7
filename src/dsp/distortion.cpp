// dsp/distortion.cpp - Waveshaping distortion implementation
//
//   y   = shape(x * gain)
//   out = mix * y * 0.9 + (1 - mix) * x
//
// The 0.9 headroom factor only scales the distorted path, so mix = 0 is an
// exact pass-through.
#include "distortion.h"

#include <algorithm>
#include <cmath>

namespace adfx {

const char* distortion_mode_name(DistortionMode mode)
{
    switch (mode) {
    case DistortionMode::TANH:       return "tanh";
    case DistortionMode::HARD:       return "hard";
    case DistortionMode::SOFT:       return "soft";
    case DistortionMode::ASYMMETRIC: return "asymmetric";
    }
    return "tanh";
}

bool distortion_mode_from_name(std::string_view name, DistortionMode& out)
{
    if (name == "tanh")       { out = DistortionMode::TANH;       return true; }
    if (name == "hard")       { out = DistortionMode::HARD;       return true; }
    if (name == "soft")       { out = DistortionMode::SOFT;       return true; }
    if (name == "asymmetric") { out = DistortionMode::ASYMMETRIC; return true; }
    return false;
}

void DspDistortion::set_config(const DistortionConfig& cfg)
{
    cfg_      = cfg;
    cfg_.gain = clamp_param(cfg.gain, 0.0f, MAX_GAIN);
    cfg_.mix  = clamp_param(cfg.mix,  0.0f, 1.0f);
}

void DspDistortion::configure(const EffectParams& params)
{
    DistortionConfig cfg = cfg_;
    params.get("gain", cfg.gain);
    params.get("mix",  cfg.mix);

    const std::string* mode = params.text("mode");
    if (!mode) mode = params.text("type");
    if (mode) distortion_mode_from_name(*mode, cfg.mode);  // unknown name keeps the current mode

    set_config(cfg);
}

float DspDistortion::shape(float x, DistortionMode mode)
{
    switch (mode) {
    case DistortionMode::TANH:
        return std::tanh(x);

    case DistortionMode::HARD: {
        const float stage1 = std::tanh(x * 0.6f);
        return std::clamp(stage1 * 2.2f, -0.95f, 0.95f);
    }

    case DistortionMode::SOFT: {
        const float even = std::tanh(x * 0.3f);
        return std::tanh(x * 1.2f) * 0.9f + even * even * 0.15f;
    }

    case DistortionMode::ASYMMETRIC:
        return (x >= 0.0f) ? std::tanh(x * 1.8f) * 1.1f
                           : std::tanh(x * 1.3f) * 0.95f;
    }
    return x;
}

bool DspDistortion::process(float* pcm, size_t frames)
{
    if (!pcm) return frames == 0;

    const float gain = cfg_.gain;
    const float wet  = cfg_.mix * OUTPUT_LEVEL;
    const float dry  = 1.0f - cfg_.mix;
    const DistortionMode mode = cfg_.mode;

    for (size_t i = 0; i < frames; i++) {
        const float x = pcm[i];
        pcm[i] = wet * shape(x * gain, mode) + dry * x;
    }
    return true;
}

} // namespace adfx
