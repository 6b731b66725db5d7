// dsp/effect.h - Effect unit interface, parameter map, effect roles
//
// Every stage of the effect chain is an EffectUnit working in place on a
// mono float32 block.  Units are created once, configured by name/value
// parameter maps and reset whenever a genre profile that uses them becomes
// active.
#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace adfx {

// ── Effect roles ──────────────────────────────────────────────────────────
// One pool instance per role.  EQ_PRE / EQ_POST are separate instances of
// the same EQ type so the Metal chain keeps independent filter memories on
// either side of the distortion stage.
enum class EffectId {
    NOISE_GATE,
    EQ_PRE,
    DISTORTION,
    EQ_POST,
    DELAY,
    COMPRESSOR,
    CHORUS,
    EQ,
    REVERB,
};

constexpr int NUM_EFFECT_IDS = 9;

inline constexpr int effect_index(EffectId id) { return static_cast<int>(id); }

// "noise_gate", "eq_pre", ... (the names used in logs and parameter tables)
const char* effect_id_name(EffectId id);
bool        effect_id_from_name(std::string_view name, EffectId& out);

// ── EffectParams - named parameter map ────────────────────────────────────
// Numeric values ("gain", "mix", ...) and text values ("mode", "preset").
// Lookups take string_view and never allocate, so a configure() pass can
// run on the audio thread at a block boundary.
class EffectParams {
public:
    EffectParams() = default;

    EffectParams& set(const std::string& key, float value);
    EffectParams& set_text(const std::string& key, const std::string& value);

    // Returns true and writes `out` when `key` holds a numeric value.
    // A NaN value counts as absent, so the current setting is kept.
    bool get(std::string_view key, float& out) const;

    // nullptr when `key` holds no text value
    const std::string* text(std::string_view key) const;

    bool   empty() const { return values_.empty() && text_.empty(); }
    size_t size()  const { return values_.size() + text_.size(); }

private:
    std::map<std::string, float, std::less<>>       values_;
    std::map<std::string, std::string, std::less<>> text_;
};

// ---------------------------------------------------------------------------
// EffectUnit - pure virtual base class
// ---------------------------------------------------------------------------
class EffectUnit {
public:
    explicit EffectUnit(EffectId id) : id_(id) {}
    virtual ~EffectUnit() = default;

    EffectUnit(const EffectUnit&) = delete;
    EffectUnit& operator=(const EffectUnit&) = delete;

    EffectId    id()   const { return id_; }
    const char* name() const { return effect_id_name(id_); }

    // Merge recognized parameters into the current configuration.
    // Out-of-range values are clamped; unknown keys are ignored.
    virtual void configure(const EffectParams& params) = 0;

    // Process one mono block in place.  Returns false if the unit could
    // not produce valid output for this block.
    virtual bool process(float* pcm, size_t frames) = 0;

    // Clear all internal state (filter memory, buffers, envelopes)
    virtual void reset() = 0;

private:
    EffectId id_;
};

// Run `fx` on a copy of `pcm` held in `scratch` (>= frames samples).
// On success the result is copied back and true is returned.  If the unit
// reports failure or produces a non-finite sample, `pcm` is left untouched
// (the stage is bypassed for this block), the unit is reset so the bad
// state cannot feed back into later blocks, and false is returned.
bool process_isolated(EffectUnit& fx, float* pcm, size_t frames, float* scratch);

// True if every sample is finite
bool block_is_finite(const float* pcm, size_t frames);

// Clamp helper shared by the configure() implementations.  NaN maps to lo.
inline float clamp_param(float v, float lo, float hi)
{
    if (std::isnan(v)) return lo;
    return v < lo ? lo : (v > hi ? hi : v);
}

} // namespace adfx
