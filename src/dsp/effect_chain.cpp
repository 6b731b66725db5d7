// dsp/effect_chain.cpp - Effect chain orchestrator
#include "effect_chain.h"
#include "chorus.h"
#include "compressor.h"
#include "delay.h"
#include "distortion.h"
#include "eq.h"
#include "noise_gate.h"
#include "reverb.h"
#include "../adfx_logger.h"

#include <algorithm>

namespace adfx {

EffectChain::EffectChain(const EffectChainConfig& cfg)
    : cfg_(cfg)
{
    if (cfg_.sample_rate <= 0) {
        ADFX_LOG(warn, "EffectChain: invalid sample rate " << cfg_.sample_rate << ", using 44100");
        cfg_.sample_rate = 44100;
    }
    if (cfg_.max_block_frames == 0) cfg_.max_block_frames = 256;

    const int sr = cfg_.sample_rate;
    pool_[effect_index(EffectId::NOISE_GATE)] = std::make_unique<DspNoiseGate>(sr);
    pool_[effect_index(EffectId::EQ_PRE)]     = std::make_unique<DspEq>(EffectId::EQ_PRE, sr);
    pool_[effect_index(EffectId::DISTORTION)] = std::make_unique<DspDistortion>();
    pool_[effect_index(EffectId::EQ_POST)]    = std::make_unique<DspEq>(EffectId::EQ_POST, sr);
    pool_[effect_index(EffectId::DELAY)]      = std::make_unique<DspDelay>(sr);
    pool_[effect_index(EffectId::COMPRESSOR)] = std::make_unique<DspCompressor>(sr);
    pool_[effect_index(EffectId::CHORUS)]     = std::make_unique<DspChorus>(sr);
    pool_[effect_index(EffectId::EQ)]         = std::make_unique<DspEq>(EffectId::EQ, sr);
    pool_[effect_index(EffectId::REVERB)]     = std::make_unique<DspReverb>(sr);

    scratch_.assign(cfg_.max_block_frames, 0.0f);

    fallback_index_ = find_genre_profile(cfg_.fallback_genre);
    if (fallback_index_ < 0) {
        ADFX_WARN("Unknown fallback genre '" + cfg_.fallback_genre + "', using " + DEFAULT_GENRE);
        cfg_.fallback_genre = DEFAULT_GENRE;
        fallback_index_     = find_genre_profile(DEFAULT_GENRE);
    }

    int initial = find_genre_profile(cfg_.initial_genre);
    if (initial < 0) {
        ADFX_WARN("Unknown genre '" + cfg_.initial_genre + "', using " + cfg_.fallback_genre);
        initial = fallback_index_;
    }

    // No audio thread yet: apply synchronously
    requested_ = initial;
    apply_profile(initial);

    const GenreProfile& p = genre_profiles()[initial];
    adfxlog.engine("INIT " + p.name, describe_pipeline(p));
}

// ---------------------------------------------------------------------------
// Control side
// ---------------------------------------------------------------------------

void EffectChain::set_genre(const std::string& name)
{
    int index = find_genre_profile(name);
    if (index < 0) {
        ADFX_WARN("Unknown genre '" + name + "', using " + cfg_.fallback_genre);
        index = fallback_index_;
    }

    {
        std::lock_guard<std::mutex> lk(request_mtx_);
        if (index == requested_) return;
        requested_ = index;
        pending_.store(index, std::memory_order_release);
    }

    const GenreProfile& p = genre_profiles()[index];
    adfxlog.engine("SWITCH " + p.name, describe_pipeline(p));
}

std::string EffectChain::current_genre() const
{
    std::lock_guard<std::mutex> lk(request_mtx_);
    return genre_profiles()[requested_].name;
}

std::string EffectChain::active_genre() const
{
    return genre_profiles()[applied_.load(std::memory_order_acquire)].name;
}

std::vector<EffectId> EffectChain::active_effects() const
{
    return genre_profiles()[applied_.load(std::memory_order_acquire)].order;
}

float EffectChain::output_gain() const
{
    return genre_profiles()[applied_.load(std::memory_order_acquire)].output_gain;
}

uint32_t EffectChain::fault_count(EffectId id) const
{
    return faults_[effect_index(id)].load(std::memory_order_relaxed);
}

uint32_t EffectChain::drain_faults()
{
    uint32_t total = 0;
    for (int i = 0; i < NUM_EFFECT_IDS; i++) {
        const uint32_t n = faults_[i].exchange(0, std::memory_order_relaxed);
        if (n == 0) continue;
        total += n;
        ADFX_LOG(warn, "Effect '" << effect_id_name(static_cast<EffectId>(i))
                       << "' bypassed for " << n << " block(s) after a processing fault");
    }
    if (total) adfxlog.engine("FAULTS", std::to_string(total) + " bypassed block(s)");
    return total;
}

void EffectChain::reset_all()
{
    for (auto& fx : pool_) fx->reset();
}

std::vector<std::string> EffectChain::available_genres()
{
    std::vector<std::string> names;
    for (const auto& p : genre_profiles()) names.push_back(p.name);
    return names;
}

// ---------------------------------------------------------------------------
// Audio side
// ---------------------------------------------------------------------------

// Push parameters, then reset every stage the profile uses - including
// instances that were already running in the previous profile.
void EffectChain::apply_profile(int index)
{
    const GenreProfile& p = genre_profiles()[index];

    for (EffectId id : p.order) {
        EffectUnit& fx = *pool_[effect_index(id)];
        if (const EffectParams* params = p.params_for(id)) {
            fx.configure(*params);
            configure_count_.fetch_add(1, std::memory_order_relaxed);
        }
        fx.reset();
        reset_count_.fetch_add(1, std::memory_order_relaxed);
    }

    active_ = &p;
    applied_.store(index, std::memory_order_release);
}

void EffectChain::process(float* pcm, size_t frames)
{
    if (!pcm || frames == 0) return;

    // A request that ends on the running profile (A -> B -> A inside one
    // block) leaves the chain untouched
    const int pending = pending_.exchange(-1, std::memory_order_acq_rel);
    if (pending >= 0 && pending != applied_.load(std::memory_order_relaxed))
        apply_profile(pending);

    const size_t max_chunk = scratch_.size();
    for (size_t done = 0; done < frames; ) {
        const size_t n = std::min(frames - done, max_chunk);
        process_chunk(pcm + done, n);
        done += n;
    }
}

void EffectChain::process_chunk(float* pcm, size_t frames)
{
    for (EffectId id : active_->order) {
        EffectUnit& fx = *pool_[effect_index(id)];
        if (!process_isolated(fx, pcm, frames, scratch_.data()))
            faults_[effect_index(id)].fetch_add(1, std::memory_order_relaxed);
    }

    const float gain = active_->output_gain;
    for (size_t i = 0; i < frames; i++) pcm[i] *= gain;
}

std::vector<float> EffectChain::process_block(const std::vector<float>& in)
{
    std::vector<float> out(in);
    process(out.data(), out.size());
    return out;
}

} // namespace adfx
