#include "cirrus/core/platform.hpp"

#include <chrono>
#include <system_error>
#include <vector>

#if defined(CIRRUS_PLATFORM_LINUX) || defined(CIRRUS_PLATFORM_MACOS)
    #include <sys/stat.h>
    #include <sys/types.h>
    #include <sys/xattr.h>
#endif

namespace cirrus {

std::optional<std::string> list_extended_attributes(const std::filesystem::path& path) {
#if defined(CIRRUS_PLATFORM_LINUX) || defined(CIRRUS_PLATFORM_MACOS)
    const std::string native = path.string();
#if defined(CIRRUS_PLATFORM_MACOS)
    const ssize_t required = ::listxattr(native.c_str(), nullptr, 0, 0);
#else
    const ssize_t required = ::listxattr(native.c_str(), nullptr, 0);
#endif
    if (required <= 0) {
        return std::nullopt;
    }

    std::vector<char> buffer(static_cast<std::size_t>(required));
#if defined(CIRRUS_PLATFORM_MACOS)
    const ssize_t length = ::listxattr(native.c_str(), buffer.data(), buffer.size(), 0);
#else
    const ssize_t length = ::listxattr(native.c_str(), buffer.data(), buffer.size());
#endif
    if (length <= 0) {
        return std::nullopt;
    }

    // The kernel hands back a sequence of NUL-terminated names
    std::string joined;
    std::size_t start = 0;
    for (std::size_t i = 0; i < static_cast<std::size_t>(length); ++i) {
        if (buffer[i] != '\0') {
            continue;
        }
        if (i > start) {
            if (!joined.empty()) {
                joined += ", ";
            }
            joined.append(buffer.data() + start, i - start);
        }
        start = i + 1;
    }
    if (joined.empty()) {
        return std::nullopt;
    }
    return joined;
#else
    (void)path;
    return std::nullopt;
#endif
}

std::optional<std::uint64_t> modified_unix_seconds(const std::filesystem::path& path) {
#if defined(CIRRUS_PLATFORM_LINUX) || defined(CIRRUS_PLATFORM_MACOS)
    struct stat info {};
    if (::stat(path.string().c_str(), &info) != 0) {
        return std::nullopt;
    }
    if (info.st_mtime < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.st_mtime);
#else
    std::error_code ec;
    const auto written = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    const auto system_time = std::chrono::time_point_cast<std::chrono::seconds>(
        written - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    const auto seconds = system_time.time_since_epoch().count();
    if (seconds < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(seconds);
#endif
}

} // namespace cirrus
