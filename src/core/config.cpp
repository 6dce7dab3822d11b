#include "cirrus/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace cirrus {
namespace {

using json = nlohmann::json;

template<typename Duration>
void read_duration(const json& j, const char* key, Duration& target) {
    if (j.contains(key)) {
        target = Duration(j.at(key).get<typename Duration::rep>());
    }
}

template<typename T>
void read_value(const json& j, const char* key, T& target) {
    if (j.contains(key)) {
        target = j.at(key).get<T>();
    }
}

} // namespace

Result<EngineConfig> parse_engine_config(const std::string& json_text) {
    EngineConfig config;
    try {
        const json j = json::parse(json_text);
        if (!j.is_object()) {
            return Err<EngineConfig>(std::string("Configuration root must be an object"));
        }

        read_duration(j, "negotiation_timeout_ms", config.negotiation_timeout);
        read_duration(j, "staleness_threshold_ms", config.staleness_threshold);
        read_duration(j, "block_upload_timeout_s", config.block_upload_timeout);
        read_duration(j, "thumbnail_upload_timeout_s", config.thumbnail_upload_timeout);
        read_value(j, "max_upload_attempts", config.max_upload_attempts);
        read_duration(j, "retry_backoff_ms", config.retry_backoff_step);
        read_value(j, "speed_window", config.speed_window);
        read_value(j, "min_useful_speed", config.min_useful_speed);
        read_value(j, "remaining_time_fallback_s", config.remaining_time_fallback_secs);
        read_value(j, "thumbnail_max_dimension", config.thumbnail_max_dimension);
        read_value(j, "thumbnail_max_source_bytes", config.thumbnail_max_source_bytes);
        read_value(j, "thumbnail_max_source_pixels", config.thumbnail_max_source_pixels);
        read_value(j, "thumbnail_jpeg_quality", config.thumbnail_jpeg_quality);
        read_value(j, "log_level", config.log_level);
        read_value(j, "admin_port", config.admin_port);

        if (j.contains("thumbnail_nonce")) {
            const auto mode = j.at("thumbnail_nonce").get<std::string>();
            if (mode == "legacy-zero") {
                config.thumbnail_nonce = ThumbnailNonceMode::LegacyZero;
            } else if (mode == "dedicated") {
                config.thumbnail_nonce = ThumbnailNonceMode::Dedicated;
            } else {
                return Err<EngineConfig>(std::string("Unknown thumbnail_nonce mode: ") + mode);
            }
        }
    } catch (const json::exception& e) {
        return Err<EngineConfig>(std::string("Invalid configuration: ") + e.what());
    }

    if (config.max_upload_attempts == 0) {
        return Err<EngineConfig>(std::string("max_upload_attempts must be > 0"));
    }
    if (config.speed_window == 0) {
        return Err<EngineConfig>(std::string("speed_window must be > 0"));
    }
    if (config.thumbnail_max_dimension == 0) {
        return Err<EngineConfig>(std::string("thumbnail_max_dimension must be > 0"));
    }
    return Ok(config);
}

Result<EngineConfig> load_engine_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<EngineConfig>(std::string("Failed to open configuration: ") + path.string());
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    return parse_engine_config(oss.str());
}

} // namespace cirrus
