#include "cirrus/core/config.hpp"

#include "support/test_support.hpp"

#include <gtest/gtest.h>

using cirrus::EngineConfig;
using cirrus::ThumbnailNonceMode;
using cirrus::load_engine_config;
using cirrus::parse_engine_config;

TEST(EngineConfigTest, DefaultsMatchDeployedBehaviour) {
    EngineConfig config;
    EXPECT_EQ(config.negotiation_timeout, std::chrono::milliseconds(30'000));
    EXPECT_EQ(config.staleness_threshold, std::chrono::milliseconds(35'000));
    EXPECT_EQ(config.max_upload_attempts, 3u);
    EXPECT_EQ(config.retry_backoff_step, std::chrono::milliseconds(1'000));
    EXPECT_EQ(config.speed_window, 5u);
    EXPECT_EQ(config.remaining_time_fallback_secs, 3600u);
    EXPECT_EQ(config.thumbnail_max_dimension, 300u);
    EXPECT_EQ(config.thumbnail_max_source_bytes, 5u * 1024 * 1024);
    EXPECT_EQ(config.thumbnail_max_source_pixels, 50'000'000u);
    EXPECT_EQ(config.thumbnail_nonce, ThumbnailNonceMode::LegacyZero);
}

TEST(EngineConfigTest, OverridesOnlyGivenKeys) {
    auto result = parse_engine_config(R"({
        "negotiation_timeout_ms": 500,
        "max_upload_attempts": 5,
        "thumbnail_nonce": "dedicated",
        "log_level": "debug"
    })");
    ASSERT_TRUE(result.is_ok()) << result.error();

    const auto& config = result.value();
    EXPECT_EQ(config.negotiation_timeout, std::chrono::milliseconds(500));
    EXPECT_EQ(config.max_upload_attempts, 5u);
    EXPECT_EQ(config.thumbnail_nonce, ThumbnailNonceMode::Dedicated);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.staleness_threshold, std::chrono::milliseconds(35'000));
}

TEST(EngineConfigTest, RejectsMalformedInput) {
    EXPECT_TRUE(parse_engine_config("{not json").is_error());
    EXPECT_TRUE(parse_engine_config("[1, 2]").is_error());
    EXPECT_TRUE(parse_engine_config(R"({"max_upload_attempts": 0})").is_error());
    EXPECT_TRUE(parse_engine_config(R"({"thumbnail_nonce": "random"})").is_error());
    EXPECT_TRUE(parse_engine_config(R"({"speed_window": "five"})").is_error());
}

TEST(EngineConfigTest, LoadsFromFile) {
    const auto dir = cirrus::testing::create_temp_dir("config");
    const auto path = dir / "engine.json";
    cirrus::testing::write_file(path, std::string(R"({"admin_port": 8099, "speed_window": 3})"));

    auto result = load_engine_config(path);
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value().admin_port, 8099);
    EXPECT_EQ(result.value().speed_window, 3u);

    EXPECT_TRUE(load_engine_config(dir / "missing.json").is_error());
}
