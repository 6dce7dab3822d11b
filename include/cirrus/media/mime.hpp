#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace cirrus::media {

/// MIME type from the file extension, application/octet-stream if unknown
std::string mime_type_for(const std::filesystem::path& path);

bool is_image_mime(const std::string& mime) noexcept;

/**
 * @brief Whether a thumbnail should be requested for a file
 *
 * Only images strictly smaller than max_source_bytes qualify.
 */
bool needs_thumbnail(const std::string& mime, std::uint64_t size, std::uint64_t max_source_bytes) noexcept;

} // namespace cirrus::media
