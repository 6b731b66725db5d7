// dsp/genre_profiles.h - Static genre → effect pipeline table
//
// Profiles are configuration data: built once on first use, never mutated.
// Lookups hand out indices/references into the table, which stays valid for
// the life of the process.
#pragma once

#include "effect.h"

#include <string>
#include <utility>
#include <vector>

namespace adfx {

struct GenreProfile {
    std::string                                name;
    // Pipeline order, first stage first
    std::vector<EffectId>                      order;
    // Parameters pushed into each stage when the profile becomes active
    std::vector<std::pair<EffectId, EffectParams>> params;
    // Applied once after the last stage
    float                                      output_gain = 1.0f;

    const EffectParams* params_for(EffectId id) const;
    bool                uses(EffectId id)       const;
};

// Profile used when a requested genre is unknown
constexpr const char* DEFAULT_GENRE = "Pop";

// All profiles in declaration order:
//   Rock/Country, Jazz/Blues, Pop, Clean, Metal
const std::vector<GenreProfile>& genre_profiles();

// Index into genre_profiles(), or -1 (exact, case-sensitive match)
int find_genre_profile(const std::string& name);

// "distortion -> eq -> reverb", or "(bypass)" for an empty chain
std::string describe_pipeline(const GenreProfile& profile);

} // namespace adfx
