/**
 * @file test_config.cpp
 * @brief Config singleton and the CodecOptions snapshot built from it
 */

#include <gtest/gtest.h>
#include "veil_config.hpp"
#include "veil_options.hpp"
#include "veil_errors.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace veil;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        Config::instance().loadDefaults();
    }
    void TearDown() override {
        Config::instance().clear();
        Config::instance().loadDefaults();
    }
};

TEST_F(ConfigTest, DefaultsMatchCodecOptions) {
    CodecOptions from_cfg = CodecOptions::from_config();
    CodecOptions plain;

    EXPECT_EQ(from_cfg.image_output_format, plain.image_output_format);
    EXPECT_EQ(from_cfg.video_fourcc, "FFV1");
    EXPECT_EQ(from_cfg.video_container, ".avi");
    EXPECT_EQ(from_cfg.video_max_redundancy, 15u);
    EXPECT_EQ(from_cfg.video_threads, 0u);
    EXPECT_EQ(from_cfg.document_max_append_bytes, 16u * 1024u * 1024u);
    EXPECT_EQ(from_cfg.kdf_opslimit, 0u);
    EXPECT_TRUE(from_cfg.memory_lock);
}

TEST_F(ConfigTest, TypedGettersFallBackOnGarbage) {
    Config& cfg = Config::instance();
    cfg.set("video.threads", "many");
    cfg.set("video.max_redundancy", "-3");
    EXPECT_EQ(cfg.getInt("video.threads", 7), 7);
    EXPECT_EQ(cfg.getUInt64("video.max_redundancy", 15), 15u);
    EXPECT_EQ(cfg.getInt("missing.key", 42), 42);
}

TEST_F(ConfigTest, BoolParsing) {
    Config& cfg = Config::instance();
    cfg.set("security.memory_lock", "Off");
    EXPECT_FALSE(cfg.getBool("security.memory_lock", true));
    cfg.set("security.memory_lock", "YES");
    EXPECT_TRUE(cfg.getBool("security.memory_lock", false));
}

TEST_F(ConfigTest, LoadFromFileOverridesDefaults) {
    auto path = std::filesystem::temp_directory_path() / "veil_config_test.conf";
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "; another comment\r\n"
            << "image.output_format = bmp\r\n"
            << "video.max_redundancy=9\n"
            << "   \n"
            << "not a pair\n";
    }

    ASSERT_TRUE(Config::instance().loadFromFile(path.string()));
    CodecOptions o = CodecOptions::from_config();
    EXPECT_EQ(o.image_output_format, "bmp");
    EXPECT_EQ(o.video_max_redundancy, 9u);
    EXPECT_EQ(o.video_fourcc, "FFV1");

    std::filesystem::remove(path);
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().loadFromFile("/nonexistent/veil.conf"));
}

TEST_F(ConfigTest, SaveAndReload) {
    auto path = std::filesystem::temp_directory_path() / "veil_config_save.conf";
    Config::instance().set("video.fourcc", "HFYU");
    ASSERT_TRUE(Config::instance().saveToFile(path.string()));

    Config::instance().clear();
    ASSERT_TRUE(Config::instance().loadFromFile(path.string()));
    EXPECT_EQ(Config::instance().get("video.fourcc"), "HFYU");

    std::filesystem::remove(path);
}

// ─── Option parsing ───────────────────────────────────────────────────────

TEST(OptionsTest, CarrierTypeTags) {
    EXPECT_EQ(carrier_type_from_string("image"), CarrierType::Image);
    EXPECT_EQ(carrier_type_from_string("Audio"), CarrierType::Audio);
    EXPECT_EQ(carrier_type_from_string("VIDEO"), CarrierType::Video);
    EXPECT_EQ(carrier_type_from_string("document"), CarrierType::Document);
    EXPECT_STREQ(carrier_type_to_string(CarrierType::Document), "document");
}

TEST(OptionsTest, UnknownCarrierTagFailsFast) {
    try {
        carrier_type_from_string("hologram");
        FAIL() << "unknown tag accepted";
    } catch (const StegoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedCarrierFormat);
    }
}

TEST(OptionsTest, RedundancyParse) {
    EXPECT_EQ(Redundancy::parse("auto").mode, Redundancy::Mode::Auto);
    EXPECT_EQ(Redundancy::parse("").mode, Redundancy::Mode::Auto);

    Redundancy r = Redundancy::parse("7");
    EXPECT_EQ(r.mode, Redundancy::Mode::Fixed);
    EXPECT_EQ(r.factor, 7u);

    EXPECT_THROW(Redundancy::parse("0"), std::invalid_argument);
    EXPECT_THROW(Redundancy::parse("32"), std::invalid_argument);
    EXPECT_THROW(Redundancy::parse("3x"), std::invalid_argument);
    EXPECT_THROW(Redundancy::parse("99999999999999999999999"), std::invalid_argument);
}
