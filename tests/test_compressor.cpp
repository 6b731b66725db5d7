/// @file test_compressor.cpp
/// @brief Tests for DspCompressor

#include "dsp/compressor.h"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

using namespace adfx;

// =============================================================================
// Static curve
// =============================================================================

TEST(CompressorTest, GainCurve) {
    CompressorConfig cfg;
    cfg.threshold_db = -18.0f;
    cfg.ratio        = 3.0f;
    DspCompressor comp;
    comp.set_config(cfg);

    EXPECT_FLOAT_EQ(comp.compute_gain_db(-30.0f), 0.0f);
    EXPECT_FLOAT_EQ(comp.compute_gain_db(-18.0f), 0.0f);
    EXPECT_FLOAT_EQ(comp.compute_gain_db(-6.0f), -8.0f);
    EXPECT_FLOAT_EQ(comp.compute_gain_db(0.0f), -12.0f);
}

TEST(CompressorTest, RatioOneIsTransparent) {
    CompressorConfig cfg;
    cfg.ratio = 1.0f;
    DspCompressor comp;
    comp.set_config(cfg);
    EXPECT_FLOAT_EQ(comp.compute_gain_db(-3.0f), 0.0f);
}

// =============================================================================
// Processing
// =============================================================================

TEST(CompressorTest, BelowThresholdOnlyMakeup) {
    DspCompressor comp;
    comp.configure(EffectParams().set("threshold", -20.0f).set("ratio", 4.0f).set("makeup_gain", 1.2f));

    std::vector<float> buf(1000);
    for (size_t i = 0; i < buf.size(); i++) buf[i] = (i % 2) ? 0.01f : -0.01f;   // -40 dBFS
    const auto in = buf;

    comp.process(buf.data(), buf.size());
    for (size_t i = 0; i < buf.size(); i++) EXPECT_FLOAT_EQ(buf[i], in[i] * 1.2f);
    EXPECT_FLOAT_EQ(comp.gain_reduction_db(), 0.0f);
}

TEST(CompressorTest, SteadyStateReduction) {
    DspCompressor comp;
    comp.configure(EffectParams().set("threshold", -20.0f).set("ratio", 4.0f).set("makeup_gain", 1.0f));

    std::vector<float> buf(44100, 0.5f);
    comp.process(buf.data(), buf.size());

    const float level_db = 20.0f * std::log10(0.5f);
    const float gain_db  = -20.0f + (level_db + 20.0f) / 4.0f - level_db;
    EXPECT_NEAR(comp.envelope(), 0.5f, 1e-4f);
    EXPECT_NEAR(comp.gain_reduction_db(), gain_db, 1e-2f);
    EXPECT_NEAR(buf.back(), 0.5f * std::pow(10.0f, gain_db / 20.0f), 1e-3f);
    EXPECT_LT(buf.back(), 0.5f);
}

TEST(CompressorTest, AttackFasterThanRelease) {
    DspCompressor comp;   // 5 ms attack, 100 ms release

    std::vector<float> loud(441, 1.0f);   // 10 ms
    comp.process(loud.data(), loud.size());
    const float after_attack = comp.envelope();
    EXPECT_GT(after_attack, 0.8f);

    std::vector<float> quiet(441, 0.0f);
    comp.process(quiet.data(), quiet.size());
    EXPECT_GT(comp.envelope(), 0.8f * after_attack);
}

TEST(CompressorTest, ResetClearsEnvelope) {
    DspCompressor comp;
    std::vector<float> buf(1000, 0.9f);
    comp.process(buf.data(), buf.size());
    EXPECT_GT(comp.envelope(), 0.0f);

    comp.reset();
    EXPECT_FLOAT_EQ(comp.envelope(), 0.0f);
    EXPECT_FLOAT_EQ(comp.gain_reduction_db(), 0.0f);
}

// =============================================================================
// Configuration
// =============================================================================

TEST(CompressorTest, ConfigureClamps) {
    DspCompressor comp;
    comp.configure(EffectParams()
                       .set("threshold", 6.0f)
                       .set("ratio", 0.5f)
                       .set("makeup_gain", 100.0f)
                       .set("attack", 0.0f)
                       .set("release", -1.0f));
    EXPECT_FLOAT_EQ(comp.config().threshold_db, 0.0f);
    EXPECT_FLOAT_EQ(comp.config().ratio, 1.0f);
    EXPECT_FLOAT_EQ(comp.config().makeup_gain, DspCompressor::MAX_MAKEUP);
    EXPECT_FLOAT_EQ(comp.config().attack_sec, DspCompressor::MIN_TIME_SEC);
    EXPECT_FLOAT_EQ(comp.config().release_sec, DspCompressor::MIN_TIME_SEC);

    comp.configure(EffectParams().set("threshold", -200.0f).set("ratio", 1000.0f));
    EXPECT_FLOAT_EQ(comp.config().threshold_db, -96.0f);
    EXPECT_FLOAT_EQ(comp.config().ratio, DspCompressor::MAX_RATIO);
}

TEST(CompressorTest, NanTimesFallToMinimum) {
    CompressorConfig cfg;
    cfg.attack_sec  = std::numeric_limits<float>::quiet_NaN();
    cfg.release_sec = std::numeric_limits<float>::quiet_NaN();
    cfg.ratio       = std::numeric_limits<float>::quiet_NaN();
    DspCompressor comp;
    comp.set_config(cfg);
    EXPECT_FLOAT_EQ(comp.config().attack_sec, DspCompressor::MIN_TIME_SEC);
    EXPECT_FLOAT_EQ(comp.config().release_sec, DspCompressor::MIN_TIME_SEC);
    EXPECT_FLOAT_EQ(comp.config().ratio, 1.0f);

    std::vector<float> buf(256, 0.5f);
    comp.process(buf.data(), buf.size());
    EXPECT_TRUE(block_is_finite(buf.data(), buf.size()));
}

TEST(CompressorTest, EnvelopeCoeff) {
    EXPECT_NEAR(envelope_coeff(0.005f, 44100), std::exp(-1.0f / (0.005f * 44100.0f)), 1e-7f);
    EXPECT_GT(envelope_coeff(0.1f, 44100), envelope_coeff(0.005f, 44100));
    EXPECT_TRUE(std::isfinite(envelope_coeff(0.0f, 44100)));
}
