// dsp/eq.h - Parametric EQ: cascade of RBJ peaking biquads (preset driven)
#pragma once

#include "effect.h"

#include <array>
#include <cstddef>
#include <string_view>

namespace adfx {

// ── Biquad filter (transposed direct form II, mono state) ─────────────────
struct Biquad {
    // Normalized coefficients (a0 = 1 absorbed)
    float b0 = 1.0f, b1 = 0.0f, b2 = 0.0f;
    float              a1 = 0.0f, a2 = 0.0f;

    // Two delay taps
    float z1 = 0.0f, z2 = 0.0f;

    inline float process(float x)
    {
        const float y = b0*x + z1;
        z1 = b1*x - a1*y + z2;
        z2 = b2*x - a2*y;
        return y;
    }

    void reset() { z1 = z2 = 0.0f; }
};

struct EqBandConfig {
    float freq_hz = 1000.0f;   // center frequency (Hz)
    float gain_db = 0.0f;      // boost / cut
    float q       = 1.0f;      // bandwidth
};

// Peaking-EQ coefficients from the RBJ Audio EQ Cookbook.
// Q <= 0 is clamped to MIN_Q, freq is clamped inside (0, Nyquist).
Biquad design_peaking(const EqBandConfig& band, int sample_rate);

// ---------------------------------------------------------------------------
// DspEq - up to MAX_BANDS peaking bands in series.  Zero bands = bypass.
// ---------------------------------------------------------------------------
class DspEq : public EffectUnit {
public:
    static constexpr int   MAX_BANDS = 8;
    static constexpr float MIN_Q     = 0.01f;

    // role: EQ, EQ_PRE or EQ_POST
    explicit DspEq(EffectId role = EffectId::EQ, int sample_rate = 44100);

    // Replace the band list: re-derives every band and zeroes filter state.
    // Bands beyond MAX_BANDS are dropped.
    void set_bands(const EqBandConfig* bands, int count);

    // Retune one existing band.  Band count and order are unchanged, so the
    // filter memory is kept.
    void set_band(int index, const EqBandConfig& cfg);
    const EqBandConfig& get_band(int index) const { return bands_[index]; }
    const Biquad&       filter(int index)   const { return filters_[index]; }
    int                 num_bands()         const { return num_bands_; }

    // Recognized: preset (text).  Unknown names fall back to "flat".
    void configure(const EffectParams& params) override;
    bool process(float* pcm, size_t frames) override;
    void reset() override;

    const char*        preset()            const { return preset_; }
    bool               last_preset_known() const { return last_preset_known_; }
    int                sample_rate()       const { return sample_rate_; }

private:
    int         sample_rate_;
    int         num_bands_         = 0;
    const char* preset_            = "flat";
    bool        last_preset_known_ = true;

    std::array<EqBandConfig, MAX_BANDS> bands_;
    std::array<Biquad,       MAX_BANDS> filters_;

    friend bool eq_apply_preset(DspEq& eq, std::string_view name);
};

// ── Named presets ─────────────────────────────────────────────────────────
void eq_preset_flat       (DspEq& eq);
void eq_preset_bright     (DspEq& eq);
void eq_preset_warm       (DspEq& eq);
void eq_preset_metal      (DspEq& eq);
void eq_preset_metal_pre  (DspEq& eq);
void eq_preset_metal_post (DspEq& eq);

// Apply preset by name: "flat","bright","warm","metal","metal_pre","metal_post"
bool eq_apply_preset(DspEq& eq, std::string_view name);

} // namespace adfx
