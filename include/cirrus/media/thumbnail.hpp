/**
 * @file thumbnail.hpp
 * @brief Preview images for uploaded pictures
 *
 * Sources are JPEG (libjpeg) or PNG (libpng), sniffed from the file
 * signature rather than the extension. Output is always baseline JPEG.
 */

#pragma once

#include "cirrus/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace cirrus::media {

/// Packed 8-bit RGB, row-major, no padding
struct Image {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> rgb;
};

/// Largest decoded area accepted by default, in pixels
inline constexpr std::uint64_t kDefaultMaxPixels = 50'000'000;

/**
 * @brief Decode a JPEG or PNG into packed RGB
 *
 * Dimensions come from the file header, so an image whose width * height
 * exceeds max_pixels is refused before any pixel buffer is allocated.
 */
Result<Image> decode_image(const std::vector<std::uint8_t>& data,
                           std::uint64_t max_pixels = kDefaultMaxPixels);

/**
 * @brief Target dimensions that fit inside max_dim x max_dim
 *
 * Aspect ratio is kept, images already inside the box keep their size,
 * and neither side drops below one pixel.
 */
std::pair<std::uint32_t, std::uint32_t> fit_within(std::uint32_t width,
                                                   std::uint32_t height,
                                                   std::uint32_t max_dim) noexcept;

/// Area-average downscale into the box returned by fit_within()
Image resize_to_fit(const Image& source, std::uint32_t max_dim);

Result<std::vector<std::uint8_t>> encode_jpeg(const Image& image, int quality);

/**
 * @brief Read, decode, shrink and re-encode an image file
 *
 * RETURNS:
 * JPEG bytes of the thumbnail, or an error for unreadable files,
 * unsupported formats and sources larger than max_pixels.
 */
Result<std::vector<std::uint8_t>> generate_thumbnail(const std::filesystem::path& path,
                                                     std::uint32_t max_dim,
                                                     int quality,
                                                     std::uint64_t max_pixels = kDefaultMaxPixels);

} // namespace cirrus::media
