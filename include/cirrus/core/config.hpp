#pragma once

#include "cirrus/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace cirrus {

enum class ThumbnailNonceMode {
    LegacyZero,   ///< All-zero nonce, shared with block 0 (what deployed decryptors expect)
    Dedicated     ///< Nonce outside the block-index space
};

/**
 * @brief Tunables of the transfer engine
 *
 * Defaults match the behaviour deployed clients rely on. Every field can be
 * overridden from a JSON file, see load_engine_config().
 */
struct EngineConfig {
    std::chrono::milliseconds negotiation_timeout{30'000};
    std::chrono::milliseconds staleness_threshold{35'000};
    std::chrono::seconds block_upload_timeout{300};
    std::chrono::seconds thumbnail_upload_timeout{60};

    std::uint32_t max_upload_attempts = 3;
    std::chrono::milliseconds retry_backoff_step{1'000};   ///< attempt * step

    std::size_t speed_window = 5;
    double min_useful_speed = 0.1;                          ///< bytes/s
    std::uint64_t remaining_time_fallback_secs = 3600;

    std::uint32_t thumbnail_max_dimension = 300;
    std::uint64_t thumbnail_max_source_bytes = 5ULL * 1024 * 1024;
    std::uint64_t thumbnail_max_source_pixels = 50'000'000;   ///< decoded width * height
    int thumbnail_jpeg_quality = 80;
    ThumbnailNonceMode thumbnail_nonce = ThumbnailNonceMode::LegacyZero;

    std::string log_level = "info";
    std::uint16_t admin_port = 0;                            ///< 0 disables the admin endpoint
};

Result<EngineConfig> load_engine_config(const std::filesystem::path& path);

Result<EngineConfig> parse_engine_config(const std::string& json_text);

} // namespace cirrus
