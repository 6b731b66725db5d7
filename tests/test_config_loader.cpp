/// @file test_config_loader.cpp
/// @brief Tests for adfx_load_config (libyaml)

#include "config_loader.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>

namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void TearDown() override
    {
        if (!path_.empty()) std::remove(path_.c_str());
    }

    const char* write(const std::string& name, const std::string& yaml)
    {
        path_ = ::testing::TempDir() + name;
        std::ofstream out(path_);
        out << yaml;
        return path_.c_str();
    }

    std::string path_;
};

} // namespace

TEST_F(ConfigLoaderTest, FullFile) {
    const char* path = write("adfx_full.yaml",
        "audio:\n"
        "  sample-rate: 48000\n"
        "  block-size: 128\n"
        "  input-device: 2\n"
        "  output-device: 3\n"
        "effects:\n"
        "  initial-genre: Rock/Country\n"
        "  fallback-genre: Clean\n"
        "log:\n"
        "  log-dir: /tmp/adfx-logs\n"
        "  log-level: 5\n"
        "  stderr: false\n");

    AdfxConfig cfg;
    ASSERT_TRUE(adfx_load_config(path, cfg));
    EXPECT_EQ(cfg.sample_rate, 48000);
    EXPECT_EQ(cfg.block_size, 128);
    EXPECT_EQ(cfg.input_device, 2);
    EXPECT_EQ(cfg.output_device, 3);
    EXPECT_EQ(cfg.initial_genre, "Rock/Country");
    EXPECT_EQ(cfg.fallback_genre, "Clean");
    EXPECT_EQ(cfg.log_dir, "/tmp/adfx-logs");
    EXPECT_EQ(cfg.log_level, 5);
    EXPECT_FALSE(cfg.log_stderr);
}

TEST_F(ConfigLoaderTest, MissingKeysKeepDefaults) {
    const char* path = write("adfx_partial.yaml",
        "effects:\n"
        "  initial-genre: Metal\n"
        "unknown-section:\n"
        "  foo: bar\n");

    AdfxConfig cfg;
    ASSERT_TRUE(adfx_load_config(path, cfg));
    EXPECT_EQ(cfg.initial_genre, "Metal");
    EXPECT_EQ(cfg.fallback_genre, "Pop");
    EXPECT_EQ(cfg.sample_rate, 44100);
    EXPECT_EQ(cfg.block_size, 64);
    EXPECT_EQ(cfg.input_device, -1);
    EXPECT_TRUE(cfg.log_stderr);
}

TEST_F(ConfigLoaderTest, MissingFileFails) {
    AdfxConfig cfg;
    EXPECT_FALSE(adfx_load_config("/nonexistent/adfx.yaml", cfg));
    EXPECT_FALSE(adfx_load_config(nullptr, cfg));
    EXPECT_FALSE(adfx_load_config("", cfg));
}

TEST_F(ConfigLoaderTest, NonMappingRootFails) {
    const char* path = write("adfx_list.yaml", "- a\n- b\n");
    AdfxConfig cfg;
    EXPECT_FALSE(adfx_load_config(path, cfg));
}

TEST_F(ConfigLoaderTest, ParseErrorFails) {
    const char* path = write("adfx_bad.yaml", "audio: [unterminated\n");
    AdfxConfig cfg;
    EXPECT_FALSE(adfx_load_config(path, cfg));
}

TEST_F(ConfigLoaderTest, InvalidBlockSizeFails) {
    const char* path = write("adfx_block.yaml",
        "audio:\n"
        "  block-size: 0\n");
    AdfxConfig cfg;
    EXPECT_FALSE(adfx_load_config(path, cfg));
}

TEST_F(ConfigLoaderTest, InvalidSampleRateFails) {
    const char* path = write("adfx_rate.yaml",
        "audio:\n"
        "  sample-rate: -1\n");
    AdfxConfig cfg;
    EXPECT_FALSE(adfx_load_config(path, cfg));
}

TEST_F(ConfigLoaderTest, NonNumericValueFails) {
    const char* path = write("adfx_text.yaml",
        "audio:\n"
        "  sample-rate: fast\n");
    AdfxConfig cfg;
    EXPECT_FALSE(adfx_load_config(path, cfg));
}

TEST_F(ConfigLoaderTest, BadBoolFails) {
    const char* path = write("adfx_bool.yaml",
        "log:\n"
        "  stderr: maybe\n");
    AdfxConfig cfg;
    EXPECT_FALSE(adfx_load_config(path, cfg));
}

TEST_F(ConfigLoaderTest, EmptyFileFails) {
    const char* path = write("adfx_empty.yaml", "");
    AdfxConfig cfg;
    EXPECT_FALSE(adfx_load_config(path, cfg));
}
