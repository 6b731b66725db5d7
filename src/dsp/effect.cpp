// dsp/effect.cpp - EffectParams, effect role names, stage isolation
#include "effect.h"

#include <algorithm>
#include <cmath>

namespace adfx {

namespace {

struct EffectName { EffectId id; const char* name; };

constexpr EffectName kEffectNames[NUM_EFFECT_IDS] = {
    { EffectId::NOISE_GATE, "noise_gate" },
    { EffectId::EQ_PRE,     "eq_pre"     },
    { EffectId::DISTORTION, "distortion" },
    { EffectId::EQ_POST,    "eq_post"    },
    { EffectId::DELAY,      "delay"      },
    { EffectId::COMPRESSOR, "compressor" },
    { EffectId::CHORUS,     "chorus"     },
    { EffectId::EQ,         "eq"         },
    { EffectId::REVERB,     "reverb"     },
};

} // namespace

const char* effect_id_name(EffectId id)
{
    const int i = effect_index(id);
    if (i < 0 || i >= NUM_EFFECT_IDS) return "unknown";
    return kEffectNames[i].name;
}

bool effect_id_from_name(std::string_view name, EffectId& out)
{
    for (const auto& e : kEffectNames) {
        if (name == e.name) { out = e.id; return true; }
    }
    return false;
}

// ── EffectParams ──────────────────────────────────────────────────────────

EffectParams& EffectParams::set(const std::string& key, float value)
{
    values_[key] = value;
    return *this;
}

EffectParams& EffectParams::set_text(const std::string& key, const std::string& value)
{
    text_[key] = value;
    return *this;
}

bool EffectParams::get(std::string_view key, float& out) const
{
    auto it = values_.find(key);
    if (it == values_.end() || std::isnan(it->second)) return false;
    out = it->second;
    return true;
}

const std::string* EffectParams::text(std::string_view key) const
{
    auto it = text_.find(key);
    return it == text_.end() ? nullptr : &it->second;
}

// ── Stage isolation ───────────────────────────────────────────────────────

bool block_is_finite(const float* pcm, size_t frames)
{
    for (size_t i = 0; i < frames; i++)
        if (!std::isfinite(pcm[i])) return false;
    return true;
}

bool process_isolated(EffectUnit& fx, float* pcm, size_t frames, float* scratch)
{
    std::copy(pcm, pcm + frames, scratch);

    if (!fx.process(scratch, frames) || !block_is_finite(scratch, frames)) {
        fx.reset();
        return false;
    }

    std::copy(scratch, scratch + frames, pcm);
    return true;
}

} // namespace adfx
