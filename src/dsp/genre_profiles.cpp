// dsp/genre_profiles.cpp - Genre profile table
#include "genre_profiles.h"

namespace adfx {

const EffectParams* GenreProfile::params_for(EffectId id) const
{
    for (const auto& p : params)
        if (p.first == id) return &p.second;
    return nullptr;
}

bool GenreProfile::uses(EffectId id) const
{
    for (EffectId e : order)
        if (e == id) return true;
    return false;
}

namespace {

std::vector<GenreProfile> build_profiles()
{
    std::vector<GenreProfile> t;

    // Controlled overdrive with a mid-hump EQ
    t.push_back({
        "Rock/Country",
        { EffectId::DISTORTION, EffectId::EQ, EffectId::REVERB },
        {
            { EffectId::DISTORTION, EffectParams().set("gain", 11.5f).set("mix", 1.0f).set_text("mode", "tanh") },
            { EffectId::EQ,         EffectParams().set_text("preset", "metal") },
            { EffectId::REVERB,     EffectParams().set("room_size", 0.1f).set("damping", 0.2f).set("mix", 0.10f) },
        },
        0.1f,
    });

    t.push_back({
        "Jazz/Blues",
        { EffectId::CHORUS, EffectId::COMPRESSOR, EffectId::EQ, EffectId::REVERB },
        {
            { EffectId::CHORUS,     EffectParams().set("rate", 1.2f).set("depth", 0.003f).set("mix", 0.4f) },
            { EffectId::COMPRESSOR, EffectParams().set("threshold", -18.0f).set("ratio", 3.0f).set("makeup_gain", 1.2f) },
            { EffectId::EQ,         EffectParams().set_text("preset", "warm") },
            { EffectId::REVERB,     EffectParams().set("room_size", 0.4f).set("damping", 0.4f).set("mix", 0.25f) },
        },
        1.05f,
    });

    t.push_back({
        "Pop",
        { EffectId::DELAY, EffectId::EQ, EffectId::REVERB },
        {
            { EffectId::DELAY,  EffectParams().set("delay_time", 0.25f).set("feedback", 0.3f).set("mix", 0.25f) },
            { EffectId::EQ,     EffectParams().set_text("preset", "bright") },
            { EffectId::REVERB, EffectParams().set("room_size", 0.3f).set("damping", 0.4f).set("mix", 0.25f) },
        },
        1.1f,
    });

    // Bypass: gain only
    t.push_back({ "Clean", {}, {}, 1.1f });

    // Gate -> pre-EQ -> distortion -> post-EQ -> delay -> compressor
    t.push_back({
        "Metal",
        { EffectId::NOISE_GATE, EffectId::EQ_PRE, EffectId::DISTORTION,
          EffectId::EQ_POST, EffectId::DELAY, EffectId::COMPRESSOR },
        {
            { EffectId::NOISE_GATE, EffectParams().set("threshold", -45.0f).set("attack", 0.001f).set("release", 0.08f) },
            { EffectId::EQ_PRE,     EffectParams().set_text("preset", "metal_pre") },
            { EffectId::DISTORTION, EffectParams().set("gain", 50.0f).set("mix", 1.0f).set_text("mode", "asymmetric") },
            { EffectId::EQ_POST,    EffectParams().set_text("preset", "metal_post") },
            { EffectId::DELAY,      EffectParams().set("delay_time", 0.33f).set("feedback", 0.4f).set("mix", 0.3f) },
            { EffectId::COMPRESSOR, EffectParams().set("threshold", -15.0f).set("ratio", 2.0f).set("makeup_gain", 1.3f) },
        },
        0.1f,
    });

    return t;
}

} // namespace

const std::vector<GenreProfile>& genre_profiles()
{
    static const std::vector<GenreProfile> table = build_profiles();
    return table;
}

int find_genre_profile(const std::string& name)
{
    const auto& t = genre_profiles();
    for (size_t i = 0; i < t.size(); i++)
        if (t[i].name == name) return static_cast<int>(i);
    return -1;
}

std::string describe_pipeline(const GenreProfile& profile)
{
    if (profile.order.empty()) return "(bypass)";

    std::string s;
    for (size_t i = 0; i < profile.order.size(); i++) {
        if (i) s += " -> ";
        s += effect_id_name(profile.order[i]);
    }
    return s;
}

} // namespace adfx
