#pragma once

#ifdef _WIN32
    #define CIRRUS_PLATFORM_WINDOWS
#elif defined(__APPLE__)
    #define CIRRUS_PLATFORM_MACOS
#else
    #define CIRRUS_PLATFORM_LINUX
#endif

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace cirrus {

enum class Platform {
    Windows,
    MacOS,
    Linux,
    Unknown
};

inline Platform get_platform() {
#ifdef CIRRUS_PLATFORM_WINDOWS
    return Platform::Windows;
#elif defined(CIRRUS_PLATFORM_MACOS)
    return Platform::MacOS;
#elif defined(CIRRUS_PLATFORM_LINUX)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

inline const char* platform_name() {
    switch(get_platform()) {
        case Platform::Windows: return "Windows";
        case Platform::MacOS: return "macOS";
        case Platform::Linux: return "Linux";
        default: return "Unknown";
    }
}

/**
 * @brief Names of the extended attributes of a file, comma separated
 *
 * Best effort: returns nullopt when the file has none, when the filesystem
 * does not support them, or on any error.
 */
std::optional<std::string> list_extended_attributes(const std::filesystem::path& path);

/// Last modification time in seconds since the Unix epoch, if available
std::optional<std::uint64_t> modified_unix_seconds(const std::filesystem::path& path);

} // namespace cirrus
