// dsp/eq.cpp - Parametric EQ implementation
//
// Coefficient formulas from the RBJ Audio EQ Cookbook (Robert Bristow-Johnson):
//   https://www.musicdsp.org/files/Audio-EQ-Cookbook.txt
#include "eq.h"

#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace adfx {

// ── RBJ peaking coefficient computation ──────────────────────────────────
Biquad design_peaking(const EqBandConfig& band, int sample_rate)
{
    const float sr    = static_cast<float>(sample_rate > 0 ? sample_rate : 44100);
    const float freq  = clamp_param(band.freq_hz, 1.0f, sr * 0.499f);
    const float q     = std::max(band.q, DspEq::MIN_Q);

    const float omega = 2.0f * static_cast<float>(M_PI) * freq / sr;
    const float sin_w = std::sin(omega);
    const float cos_w = std::cos(omega);
    const float A     = std::pow(10.0f, band.gain_db / 40.0f);
    const float alpha = sin_w / (2.0f * q);

    const float b0 =  1.0f + alpha * A;
    const float b1 = -2.0f * cos_w;
    const float b2 =  1.0f - alpha * A;
    const float a0 =  1.0f + alpha / A;
    const float a1 = -2.0f * cos_w;
    const float a2 =  1.0f - alpha / A;

    // Normalize by a0
    Biquad f;
    f.b0 = b0 / a0;
    f.b1 = b1 / a0;
    f.b2 = b2 / a0;
    f.a1 = a1 / a0;
    f.a2 = a2 / a0;
    return f;
}

DspEq::DspEq(EffectId role, int sample_rate)
    : EffectUnit(role)
    , sample_rate_(sample_rate > 0 ? sample_rate : 44100)
{
}

void DspEq::set_bands(const EqBandConfig* bands, int count)
{
    num_bands_ = std::clamp(count, 0, MAX_BANDS);
    for (int i = 0; i < num_bands_; i++) {
        bands_[i]   = bands[i];
        filters_[i] = design_peaking(bands_[i], sample_rate_);
    }
}

void DspEq::set_band(int index, const EqBandConfig& cfg)
{
    if (index < 0 || index >= num_bands_) return;
    bands_[index] = cfg;

    const Biquad designed = design_peaking(cfg, sample_rate_);
    Biquad& f = filters_[index];
    f.b0 = designed.b0; f.b1 = designed.b1; f.b2 = designed.b2;
    f.a1 = designed.a1; f.a2 = designed.a2;
}

void DspEq::reset()
{
    for (auto& f : filters_) f.reset();
}

void DspEq::configure(const EffectParams& params)
{
    const std::string* name = params.text("preset");
    if (!name) return;

    last_preset_known_ = eq_apply_preset(*this, *name);
    if (!last_preset_known_) eq_apply_preset(*this, "flat");
}

bool DspEq::process(float* pcm, size_t frames)
{
    if (!pcm) return frames == 0;

    for (int bi = 0; bi < num_bands_; bi++) {
        if (bands_[bi].gain_db == 0.0f) continue;
        auto& filt = filters_[bi];
        for (size_t i = 0; i < frames; i++)
            pcm[i] = filt.process(pcm[i]);
    }
    return true;
}

// ── Presets ────────────────────────────────────────────────────────────────

namespace {

void apply_table(DspEq& eq, const EqBandConfig* bands, int count)
{
    eq.set_bands(bands, count);
    eq.reset();
}

} // namespace

void eq_preset_flat(DspEq& eq)
{
    apply_table(eq, nullptr, 0);
}

void eq_preset_bright(DspEq& eq)
{
    // Pop: lift high-mids and highs
    static constexpr EqBandConfig b[] = {
        { 2000.0f, 7.0f, 1.0f },
        { 5000.0f, 6.0f, 1.0f },
    };
    apply_table(eq, b, 2);
}

void eq_preset_warm(DspEq& eq)
{
    // Jazz/blues: low-mid body
    static constexpr EqBandConfig b[] = {
        { 200.0f, 4.0f, 1.0f },
        { 800.0f, 5.0f, 1.0f },
    };
    apply_table(eq, b, 2);
}

void eq_preset_metal(DspEq& eq)
{
    // Classic rock overdrive: strong mid hump for sustain
    static constexpr EqBandConfig b[] = {
        {  100.0f, 1.0f, 1.0f },   // bass warmth
        {  400.0f, 3.0f, 0.9f },   // low-mid body
        {  800.0f, 8.0f, 0.8f },   // mid hump
        { 1500.0f, 5.0f, 0.9f },   // upper-mid presence
        { 3000.0f, 3.0f, 1.0f },   // high-mid clarity
        { 6000.0f, 1.0f, 1.2f },   // treble definition
    };
    apply_table(eq, b, 6);
}

void eq_preset_metal_pre(DspEq& eq)
{
    // Ahead of the clipper: tighten lows, push mids into the distortion
    static constexpr EqBandConfig b[] = {
        {  135.0f, -15.0f, 0.7f },  // high-pass stand-in
        { 1000.0f,  13.0f, 1.0f },  // mid focus
        { 2500.0f,   6.0f, 1.2f },  // pick attack
    };
    apply_table(eq, b, 3);
}

void eq_preset_metal_post(DspEq& eq)
{
    // After the clipper: fizz control, scooped V-shape, solo lift
    static constexpr EqBandConfig b[] = {
        { 7000.0f, -10.0f, 0.7f },  // fizz control
        {   90.0f,  18.0f, 1.2f },  // sub punch
        {  150.0f,  35.0f, 0.8f },  // chug weight
        {  500.0f, -14.0f, 1.0f },  // mid scoop
        { 3000.0f,  15.0f, 1.1f },  // upper-mid harmonics
        { 5000.0f,  24.0f, 0.9f },  // pick attack
        { 1500.0f,  13.5f, 0.8f },  // solo mid lift
    };
    apply_table(eq, b, 7);
}

bool eq_apply_preset(DspEq& eq, std::string_view name)
{
    if (name == "flat")       { eq_preset_flat(eq);       eq.preset_ = "flat";       return true; }
    if (name == "bright")     { eq_preset_bright(eq);     eq.preset_ = "bright";     return true; }
    if (name == "warm")       { eq_preset_warm(eq);       eq.preset_ = "warm";       return true; }
    if (name == "metal")      { eq_preset_metal(eq);      eq.preset_ = "metal";      return true; }
    if (name == "metal_pre")  { eq_preset_metal_pre(eq);  eq.preset_ = "metal_pre";  return true; }
    if (name == "metal_post") { eq_preset_metal_post(eq); eq.preset_ = "metal_post"; return true; }
    return false;
}

} // namespace adfx
