/// @file test_reverb.cpp
/// @brief Tests for DspReverb

#include "dsp/reverb.h"
#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <vector>

using namespace adfx;

namespace {

std::vector<float> noise(size_t n, unsigned seed = 3)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<float> v(n);
    for (auto& s : v) s = dist(rng);
    return v;
}

ReverbConfig make_config(float room, float damping, float mix)
{
    ReverbConfig cfg;
    cfg.room_size = room;
    cfg.damping   = damping;
    cfg.mix       = mix;
    return cfg;
}

} // namespace

// =============================================================================
// Topology
// =============================================================================

TEST(ReverbTest, TuningAt44100) {
    DspReverb rv(44100);
    const size_t combs[] = { 1557, 1617, 1491, 1422, 1277, 1356, 1188, 1116 };
    const size_t aps[]   = { 225, 556, 441, 341 };
    for (int i = 0; i < DspReverb::NUM_COMBS; i++)     EXPECT_EQ(rv.comb_length(i), combs[i]);
    for (int i = 0; i < DspReverb::NUM_ALLPASSES; i++) EXPECT_EQ(rv.allpass_length(i), aps[i]);
}

TEST(ReverbTest, TuningScalesWithRate) {
    DspReverb rv(48000);
    EXPECT_EQ(rv.comb_length(0), 1694u);      // 1557 * 48000 / 44100
    EXPECT_EQ(rv.allpass_length(0), 244u);    // 225 * 48000 / 44100
}

TEST(ReverbTest, CombFeedbackFromRoomSize) {
    DspReverb rv;
    rv.set_config(make_config(0.5f, 0.5f, 0.3f));
    EXPECT_FLOAT_EQ(rv.comb_feedback(), 0.89f);
    rv.set_config(make_config(0.0f, 0.5f, 0.3f));
    EXPECT_FLOAT_EQ(rv.comb_feedback(), 0.84f);
    rv.set_config(make_config(1.0f, 0.5f, 0.3f));
    EXPECT_FLOAT_EQ(rv.comb_feedback(), 0.94f);
}

// =============================================================================
// Processing
// =============================================================================

TEST(ReverbTest, MixZeroIsDry) {
    DspReverb rv;
    rv.set_config(make_config(0.9f, 0.1f, 0.0f));

    const auto in = noise(4000);
    auto out = in;
    ASSERT_TRUE(rv.process(out.data(), out.size()));
    for (size_t i = 0; i < in.size(); i++) EXPECT_EQ(out[i], in[i]);
}

TEST(ReverbTest, ImpulseTailStartsAtShortestComb) {
    DspReverb rv(44100);
    rv.set_config(make_config(0.5f, 0.5f, 1.0f));

    std::vector<float> buf(20000, 0.0f);
    buf[0] = 1.0f;
    rv.process(buf.data(), buf.size());

    for (size_t i = 0; i < 1116; i++) EXPECT_EQ(buf[i], 0.0f) << i;
    EXPECT_NE(buf[1116], 0.0f);

    double energy = 0.0;
    for (size_t i = 10000; i < buf.size(); i++) energy += buf[i] * buf[i];
    EXPECT_GT(energy, 0.0);
    for (float s : buf) EXPECT_TRUE(std::isfinite(s));
}

TEST(ReverbTest, TailDecays) {
    DspReverb rv(44100);
    rv.set_config(make_config(1.0f, 0.0f, 1.0f));

    std::vector<float> buf(44100 * 3, 0.0f);
    buf[0] = 1.0f;
    rv.process(buf.data(), buf.size());

    auto rms = [&](size_t from, size_t to) {
        double e = 0.0;
        for (size_t i = from; i < to; i++) e += buf[i] * buf[i];
        return std::sqrt(e / static_cast<double>(to - from));
    };
    EXPECT_LT(rms(88200, 132300), rms(2000, 44100));
}

TEST(ReverbTest, ResetClearsTail) {
    DspReverb rv;
    rv.set_config(make_config(0.8f, 0.3f, 1.0f));

    auto buf = noise(5000);
    rv.process(buf.data(), buf.size());
    rv.reset();

    std::vector<float> silence(5000, 0.0f);
    rv.process(silence.data(), silence.size());
    for (float s : silence) EXPECT_EQ(s, 0.0f);
}

TEST(ReverbTest, ConfigureClamps) {
    DspReverb rv;
    rv.configure(EffectParams().set("room_size", 2.0f).set("damping", -1.0f).set("mix", 5.0f));
    EXPECT_FLOAT_EQ(rv.config().room_size, 1.0f);
    EXPECT_FLOAT_EQ(rv.config().damping, 0.0f);
    EXPECT_FLOAT_EQ(rv.config().mix, 1.0f);
}
