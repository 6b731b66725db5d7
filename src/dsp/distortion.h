// dsp/distortion.h - Waveshaping overdrive / distortion (stateless)
#pragma once

#include "effect.h"

#include <cstddef>
#include <string_view>

namespace adfx {

// ── Clipping curves ───────────────────────────────────────────────────────
enum class DistortionMode {
    TANH,        // symmetric tube-style saturation
    HARD,        // soft pre-saturation, then hard clip at ±0.95
    SOFT,        // tanh plus squared-tanh even harmonics
    ASYMMETRIC,  // harder positive half, milder negative half
};

const char* distortion_mode_name(DistortionMode mode);
bool        distortion_mode_from_name(std::string_view name, DistortionMode& out);

struct DistortionConfig {
    // Pre-gain applied before the waveshaper
    float          gain = 5.0f;
    // 0.0 = dry, 1.0 = fully distorted
    float          mix  = 1.0f;
    DistortionMode mode = DistortionMode::TANH;
};

// ---------------------------------------------------------------------------
// DspDistortion
// ---------------------------------------------------------------------------
class DspDistortion : public EffectUnit {
public:
    // Fixed attenuation of the distorted path (headroom)
    static constexpr float OUTPUT_LEVEL = 0.9f;
    static constexpr float MAX_GAIN     = 100.0f;

    DspDistortion() : EffectUnit(EffectId::DISTORTION) {}

    void set_config(const DistortionConfig& cfg);
    const DistortionConfig& config() const { return cfg_; }

    // Recognized: gain, mix, mode (alias: type)
    void configure(const EffectParams& params) override;
    bool process(float* pcm, size_t frames) override;

    // No state to clear
    void reset() override {}

    // Nonlinearity applied to an already pre-gained sample
    static float shape(float x, DistortionMode mode);

private:
    DistortionConfig cfg_;
};

} // namespace adfx
