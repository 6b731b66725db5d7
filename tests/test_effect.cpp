/// @file test_effect.cpp
/// @brief Tests for EffectParams, effect role names and stage isolation

#include "dsp/effect.h"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

using namespace adfx;

namespace {

// Test double: fixed behavior per block, counts resets
class ScriptedUnit : public EffectUnit {
public:
    enum class Mode { SCALE, FAIL, NAN_OUT };

    explicit ScriptedUnit(Mode mode) : EffectUnit(EffectId::EQ), mode_(mode) {}

    void configure(const EffectParams&) override {}

    bool process(float* pcm, size_t frames) override
    {
        for (size_t i = 0; i < frames; i++) pcm[i] *= 2.0f;
        if (mode_ == Mode::NAN_OUT && frames > 0)
            pcm[frames / 2] = std::numeric_limits<float>::quiet_NaN();
        return mode_ != Mode::FAIL;
    }

    void reset() override { resets++; }

    int resets = 0;

private:
    Mode mode_;
};

} // namespace

// =============================================================================
// EffectParams
// =============================================================================

TEST(EffectParamsTest, NumericAndText) {
    EffectParams p;
    EXPECT_TRUE(p.empty());

    p.set("gain", 2.5f).set_text("mode", "soft");
    EXPECT_EQ(p.size(), 2u);

    float v = 0.0f;
    EXPECT_TRUE(p.get("gain", v));
    EXPECT_FLOAT_EQ(v, 2.5f);

    float untouched = 7.0f;
    EXPECT_FALSE(p.get("mix", untouched));
    EXPECT_FLOAT_EQ(untouched, 7.0f);
    EXPECT_FALSE(p.get("mode", untouched));

    ASSERT_NE(p.text("mode"), nullptr);
    EXPECT_EQ(*p.text("mode"), "soft");
    EXPECT_EQ(p.text("gain"), nullptr);
}

TEST(EffectParamsTest, NanValueIsIgnored) {
    EffectParams p;
    p.set("mix", std::numeric_limits<float>::quiet_NaN())
     .set("gain", std::numeric_limits<float>::infinity());

    float mix = 0.3f;
    EXPECT_FALSE(p.get("mix", mix));
    EXPECT_FLOAT_EQ(mix, 0.3f);

    // Infinity is a value; the unit's clamp bounds it
    float gain = 0.0f;
    EXPECT_TRUE(p.get("gain", gain));
    EXPECT_TRUE(std::isinf(gain));
}

TEST(EffectParamsTest, SetOverwrites) {
    EffectParams p;
    p.set("mix", 0.1f).set("mix", 0.9f);
    float v = 0.0f;
    ASSERT_TRUE(p.get("mix", v));
    EXPECT_FLOAT_EQ(v, 0.9f);
    EXPECT_EQ(p.size(), 1u);
}

// =============================================================================
// Effect roles
// =============================================================================

TEST(EffectIdTest, NamesRoundTrip) {
    for (int i = 0; i < NUM_EFFECT_IDS; i++) {
        const EffectId id = static_cast<EffectId>(i);
        EffectId back = EffectId::EQ;
        ASSERT_TRUE(effect_id_from_name(effect_id_name(id), back)) << i;
        EXPECT_EQ(back, id);
    }
    EXPECT_STREQ(effect_id_name(EffectId::NOISE_GATE), "noise_gate");

    EffectId out;
    EXPECT_FALSE(effect_id_from_name("flanger", out));
}

// =============================================================================
// Stage isolation
// =============================================================================

TEST(ProcessIsolatedTest, SuccessCopiesResult) {
    ScriptedUnit fx(ScriptedUnit::Mode::SCALE);
    std::vector<float> pcm = { 0.1f, -0.2f, 0.3f };
    std::vector<float> scratch(3);

    EXPECT_TRUE(process_isolated(fx, pcm.data(), pcm.size(), scratch.data()));
    EXPECT_FLOAT_EQ(pcm[0], 0.2f);
    EXPECT_FLOAT_EQ(pcm[1], -0.4f);
    EXPECT_FLOAT_EQ(pcm[2], 0.6f);
    EXPECT_EQ(fx.resets, 0);
}

TEST(ProcessIsolatedTest, FailureBypassesAndResets) {
    ScriptedUnit fx(ScriptedUnit::Mode::FAIL);
    const std::vector<float> in = { 0.1f, -0.2f, 0.3f, 0.4f };
    auto pcm = in;
    std::vector<float> scratch(4);

    EXPECT_FALSE(process_isolated(fx, pcm.data(), pcm.size(), scratch.data()));
    EXPECT_EQ(pcm, in);
    EXPECT_EQ(fx.resets, 1);
}

TEST(ProcessIsolatedTest, NonFiniteOutputBypasses) {
    ScriptedUnit fx(ScriptedUnit::Mode::NAN_OUT);
    const std::vector<float> in = { 0.5f, 0.5f, 0.5f, 0.5f };
    auto pcm = in;
    std::vector<float> scratch(4);

    EXPECT_FALSE(process_isolated(fx, pcm.data(), pcm.size(), scratch.data()));
    EXPECT_EQ(pcm, in);
    EXPECT_EQ(fx.resets, 1);
}

TEST(ProcessIsolatedTest, BlockIsFinite) {
    std::vector<float> v = { 0.0f, 1.0f, -1.0f };
    EXPECT_TRUE(block_is_finite(v.data(), v.size()));
    v[1] = std::numeric_limits<float>::infinity();
    EXPECT_FALSE(block_is_finite(v.data(), v.size()));
    EXPECT_TRUE(block_is_finite(nullptr, 0));
}

TEST(ClampParamTest, Bounds) {
    EXPECT_FLOAT_EQ(clamp_param(-1.0f, 0.0f, 1.0f), 0.0f);
    EXPECT_FLOAT_EQ(clamp_param(2.0f, 0.0f, 1.0f), 1.0f);
    EXPECT_FLOAT_EQ(clamp_param(0.3f, 0.0f, 1.0f), 0.3f);
}

TEST(ClampParamTest, NonFinite) {
    EXPECT_FLOAT_EQ(clamp_param(std::numeric_limits<float>::quiet_NaN(), 0.0f, 1.0f), 0.0f);
    EXPECT_FLOAT_EQ(clamp_param(std::numeric_limits<float>::infinity(), 0.0f, 1.0f), 1.0f);
    EXPECT_FLOAT_EQ(clamp_param(-std::numeric_limits<float>::infinity(), -96.0f, 0.0f), -96.0f);
}
