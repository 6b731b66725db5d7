// dsp/effect_chain.h - Genre-switched effect chain
//
// Processing order per audio block:
//   [Input PCM float32, mono] → stage 1 → stage 2 → … → × output gain
// The stages and their parameters come from the active GenreProfile.
//
// Threading:
//   process()    - audio thread only, never blocks, never allocates.
//   set_genre()  - any thread.  Publishes the requested profile through a
//                  single-slot mailbox; the audio thread picks it up at the
//                  start of its next block and applies it whole (order,
//                  parameter pushes, resets, output gain) before touching
//                  any sample.  A switch therefore lands between blocks.
#pragma once

#include "effect.h"
#include "genre_profiles.h"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace adfx {

struct EffectChainConfig {
    int         sample_rate      = 44100;
    // Largest block processed in one pass; longer blocks are split
    size_t      max_block_frames = 256;
    std::string initial_genre    = DEFAULT_GENRE;
    std::string fallback_genre   = DEFAULT_GENRE;
};

// ---------------------------------------------------------------------------
// EffectChain - owns one effect instance per role; called from audio thread
// ---------------------------------------------------------------------------
class EffectChain {
public:
    explicit EffectChain(const EffectChainConfig& cfg = EffectChainConfig());
    ~EffectChain() = default;

    EffectChain(const EffectChain&) = delete;
    EffectChain& operator=(const EffectChain&) = delete;

    // Request a genre profile.  Same as the last request: no-op.
    // Unknown name: WARN, then behaves as set_genre(fallback).
    void set_genre(const std::string& name);

    // Process one mono block in place
    void process(float* pcm, size_t frames);

    // Copying wrapper for non-realtime callers
    std::vector<float> process_block(const std::vector<float>& in);

    // Last requested genre (what set_genre resolved to)
    std::string current_genre() const;

    // Genre whose configuration the audio thread is running
    std::string active_genre() const;

    // Stage order / output gain of the active profile
    std::vector<EffectId> active_effects() const;
    float                 output_gain()    const;

    // Counters of effect resets / parameter pushes done by profile switches
    uint64_t reset_count()     const { return reset_count_.load(); }
    uint64_t configure_count() const { return configure_count_.load(); }

    // Blocks in which `id` was bypassed after a fault, since the last drain
    uint32_t fault_count(EffectId id) const;

    // Log and clear fault counters (control thread).  Returns the total.
    uint32_t drain_faults();

    // Reset every pool instance.  Not synchronized with process(): call
    // only while no audio thread is running.
    void reset_all();

    // Direct access to a pool instance.  Same restriction as reset_all().
    EffectUnit&       effect(EffectId id)       { return *pool_[effect_index(id)]; }
    const EffectUnit& effect(EffectId id) const { return *pool_[effect_index(id)]; }

    const EffectChainConfig& config() const { return cfg_; }

    static std::vector<std::string> available_genres();

private:
    EffectChainConfig cfg_;
    int               fallback_index_ = 0;

    std::array<std::unique_ptr<EffectUnit>, NUM_EFFECT_IDS> pool_;

    // Audio thread state
    const GenreProfile* active_ = nullptr;
    std::vector<float>  scratch_;

    // Control side: last requested profile
    mutable std::mutex request_mtx_;
    int                requested_ = -1;

    // Mailbox: profile index waiting to be applied, -1 = none
    std::atomic<int> pending_{-1};
    std::atomic<int> applied_{-1};

    std::atomic<uint64_t> reset_count_{0};
    std::atomic<uint64_t> configure_count_{0};
    std::array<std::atomic<uint32_t>, NUM_EFFECT_IDS> faults_{};

    void apply_profile(int index);
    void process_chunk(float* pcm, size_t frames);
};

} // namespace adfx
