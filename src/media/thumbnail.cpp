#include "cirrus/media/thumbnail.hpp"

#include <cstdio>
#include <csetjmp>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

#include <jpeglib.h>
#include <png.h>

namespace cirrus::media {
namespace {

// ════════════════════════════════════════════════════════
// libjpeg error handling
// ════════════════════════════════════════════════════════

struct JpegErrorManager {
    jpeg_error_mgr pub;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void on_jpeg_error(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    std::longjmp(err->jump, 1);
}

void on_jpeg_message(j_common_ptr) {
    // Warnings are not fatal and stderr belongs to the logger
}

std::string oversize_message(std::uint32_t width, std::uint32_t height, std::uint64_t max_pixels) {
    return "Image too large: " + std::to_string(width) + "x" + std::to_string(height) +
           " exceeds " + std::to_string(max_pixels) + " pixels";
}

bool exceeds_pixels(std::uint32_t width, std::uint32_t height, std::uint64_t max_pixels) {
    return static_cast<std::uint64_t>(width) * height > max_pixels;
}

bool looks_like_jpeg(const std::vector<std::uint8_t>& data) {
    return data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}

bool looks_like_png(const std::vector<std::uint8_t>& data) {
    static constexpr std::uint8_t kSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (data.size() < sizeof(kSignature)) {
        return false;
    }
    for (std::size_t i = 0; i < sizeof(kSignature); ++i) {
        if (data[i] != kSignature[i]) {
            return false;
        }
    }
    return true;
}

// No C++ object may be constructed between setjmp and the libjpeg calls
// that can longjmp back, so everything with a destructor lives in the caller.
// The pixel buffer is only sized once the header passed the area check.
bool read_jpeg(const std::vector<std::uint8_t>& data, std::uint64_t max_pixels, Image& out, std::string& error) {
    jpeg_decompress_struct cinfo;
    JpegErrorManager err;
    cinfo.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = on_jpeg_error;
    err.pub.output_message = on_jpeg_message;

    if (setjmp(err.jump)) {
        jpeg_destroy_decompress(&cinfo);
        error = err.message;
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, data.data(), static_cast<unsigned long>(data.size()));
    jpeg_read_header(&cinfo, TRUE);
    if (exceeds_pixels(cinfo.image_width, cinfo.image_height, max_pixels)) {
        out.width = cinfo.image_width;
        out.height = cinfo.image_height;
        jpeg_destroy_decompress(&cinfo);
        return false;
    }
    cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&cinfo);

    out.width = cinfo.output_width;
    out.height = cinfo.output_height;
    out.rgb.resize(static_cast<std::size_t>(out.width) * out.height * 3);

    const std::size_t stride = static_cast<std::size_t>(out.width) * 3;
    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = out.rgb.data() + static_cast<std::size_t>(cinfo.output_scanline) * stride;
        jpeg_read_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return true;
}

bool write_jpeg(const Image& image, int quality, unsigned char*& buffer, unsigned long& size, std::string& error) {
    jpeg_compress_struct cinfo;
    JpegErrorManager err;
    cinfo.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = on_jpeg_error;
    err.pub.output_message = on_jpeg_message;

    if (setjmp(err.jump)) {
        jpeg_destroy_compress(&cinfo);
        error = err.message;
        return false;
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &buffer, &size);

    cinfo.image_width = image.width;
    cinfo.image_height = image.height;
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    const std::size_t stride = static_cast<std::size_t>(image.width) * 3;
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPLE*>(image.rgb.data() + static_cast<std::size_t>(cinfo.next_scanline) * stride);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    return true;
}

Result<Image> decode_png(const std::vector<std::uint8_t>& data, std::uint64_t max_pixels) {
    png_image png{};
    png.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&png, data.data(), data.size())) {
        std::string message = png.message;
        png_image_free(&png);
        return Err<Image>("PNG decode failed: " + message);
    }

    if (exceeds_pixels(png.width, png.height, max_pixels)) {
        const std::uint32_t width = png.width;
        const std::uint32_t height = png.height;
        png_image_free(&png);
        return Err<Image>(oversize_message(width, height, max_pixels));
    }

    png.format = PNG_FORMAT_RGB;
    Image image;
    image.width = png.width;
    image.height = png.height;
    image.rgb.resize(PNG_IMAGE_SIZE(png));

    // Transparent pixels are flattened onto white
    const png_color background{0xFF, 0xFF, 0xFF};
    if (!png_image_finish_read(&png, &background, image.rgb.data(), 0, nullptr)) {
        std::string message = png.message;
        png_image_free(&png);
        return Err<Image>("PNG decode failed: " + message);
    }
    return Ok(std::move(image));
}

} // namespace

Result<Image> decode_image(const std::vector<std::uint8_t>& data, std::uint64_t max_pixels) {
    if (looks_like_png(data)) {
        return decode_png(data, max_pixels);
    }
    if (!looks_like_jpeg(data)) {
        return Err<Image>(std::string("Unsupported image format"));
    }

    Image image;
    std::string error;
    if (!read_jpeg(data, max_pixels, image, error)) {
        if (error.empty()) {
            return Err<Image>(oversize_message(image.width, image.height, max_pixels));
        }
        return Err<Image>("JPEG decode failed: " + error);
    }
    if (image.width == 0 || image.height == 0) {
        return Err<Image>(std::string("JPEG decode failed: empty image"));
    }
    return Ok(std::move(image));
}

std::pair<std::uint32_t, std::uint32_t> fit_within(std::uint32_t width,
                                                   std::uint32_t height,
                                                   std::uint32_t max_dim) noexcept {
    if (width <= max_dim && height <= max_dim) {
        return {width, height};
    }
    if (width >= height) {
        const auto scaled = static_cast<std::uint64_t>(height) * max_dim / width;
        return {max_dim, static_cast<std::uint32_t>(scaled > 0 ? scaled : 1)};
    }
    const auto scaled = static_cast<std::uint64_t>(width) * max_dim / height;
    return {static_cast<std::uint32_t>(scaled > 0 ? scaled : 1), max_dim};
}

Image resize_to_fit(const Image& source, std::uint32_t max_dim) {
    const auto [target_w, target_h] = fit_within(source.width, source.height, max_dim);
    if (target_w == source.width && target_h == source.height) {
        return source;
    }

    Image out;
    out.width = target_w;
    out.height = target_h;
    out.rgb.resize(static_cast<std::size_t>(target_w) * target_h * 3);

    // Each target pixel averages the source rectangle it covers
    for (std::uint32_t ty = 0; ty < target_h; ++ty) {
        const std::uint32_t y0 = static_cast<std::uint32_t>(static_cast<std::uint64_t>(ty) * source.height / target_h);
        std::uint32_t y1 = static_cast<std::uint32_t>(static_cast<std::uint64_t>(ty + 1) * source.height / target_h);
        if (y1 <= y0) {
            y1 = y0 + 1;
        }

        for (std::uint32_t tx = 0; tx < target_w; ++tx) {
            const std::uint32_t x0 = static_cast<std::uint32_t>(static_cast<std::uint64_t>(tx) * source.width / target_w);
            std::uint32_t x1 = static_cast<std::uint32_t>(static_cast<std::uint64_t>(tx + 1) * source.width / target_w);
            if (x1 <= x0) {
                x1 = x0 + 1;
            }

            std::uint64_t sum[3] = {0, 0, 0};
            for (std::uint32_t y = y0; y < y1; ++y) {
                const std::uint8_t* row = source.rgb.data() + (static_cast<std::size_t>(y) * source.width + x0) * 3;
                for (std::uint32_t x = x0; x < x1; ++x) {
                    sum[0] += row[0];
                    sum[1] += row[1];
                    sum[2] += row[2];
                    row += 3;
                }
            }

            const std::uint64_t count = static_cast<std::uint64_t>(y1 - y0) * (x1 - x0);
            std::uint8_t* dst = out.rgb.data() + (static_cast<std::size_t>(ty) * target_w + tx) * 3;
            dst[0] = static_cast<std::uint8_t>(sum[0] / count);
            dst[1] = static_cast<std::uint8_t>(sum[1] / count);
            dst[2] = static_cast<std::uint8_t>(sum[2] / count);
        }
    }
    return out;
}

Result<std::vector<std::uint8_t>> encode_jpeg(const Image& image, int quality) {
    using Bytes = std::vector<std::uint8_t>;
    if (image.width == 0 || image.height == 0 ||
        image.rgb.size() != static_cast<std::size_t>(image.width) * image.height * 3) {
        return Err<Bytes>(std::string("JPEG encode failed: invalid image buffer"));
    }

    unsigned char* buffer = nullptr;
    unsigned long size = 0;
    std::string error;
    const bool ok = write_jpeg(image, quality, buffer, size, error);

    Bytes encoded;
    if (ok && buffer != nullptr) {
        encoded.assign(buffer, buffer + size);
    }
    // jpeg_mem_dest allocates with malloc
    std::free(buffer);

    if (!ok) {
        return Err<Bytes>("JPEG encode failed: " + error);
    }
    return Ok(std::move(encoded));
}

Result<std::vector<std::uint8_t>> generate_thumbnail(const std::filesystem::path& path,
                                                     std::uint32_t max_dim,
                                                     int quality,
                                                     std::uint64_t max_pixels) {
    using Bytes = std::vector<std::uint8_t>;
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<Bytes>(std::string("Failed to open image: ") + path.string());
    }
    Bytes data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

    auto decoded = decode_image(data, max_pixels);
    if (decoded.is_error()) {
        return Err<Bytes>(decoded.error());
    }

    const Image thumb = resize_to_fit(decoded.value(), max_dim);
    return encode_jpeg(thumb, quality);
}

} // namespace cirrus::media
