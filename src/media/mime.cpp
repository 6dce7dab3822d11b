#include "cirrus/media/mime.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace cirrus::media {
namespace {

const std::unordered_map<std::string, std::string>& extension_table() {
    static const std::unordered_map<std::string, std::string> table = {
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"bmp", "image/bmp"},
        {"webp", "image/webp"},
        {"tif", "image/tiff"},
        {"tiff", "image/tiff"},
        {"svg", "image/svg+xml"},
        {"ico", "image/x-icon"},
        {"heic", "image/heic"},
        {"txt", "text/plain"},
        {"md", "text/markdown"},
        {"csv", "text/csv"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"js", "text/javascript"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"7z", "application/x-7z-compressed"},
        {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"ppt", "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"ogg", "audio/ogg"},
        {"flac", "audio/flac"},
        {"mp4", "video/mp4"},
        {"mov", "video/quicktime"},
        {"mkv", "video/x-matroska"},
        {"webm", "video/webm"},
        {"avi", "video/x-msvideo"},
    };
    return table;
}

} // namespace

std::string mime_type_for(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (ext.size() < 2) {
        return "application/octet-stream";
    }
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    const auto& table = extension_table();
    auto it = table.find(ext);
    return it != table.end() ? it->second : "application/octet-stream";
}

bool is_image_mime(const std::string& mime) noexcept {
    return mime.rfind("image/", 0) == 0;
}

bool needs_thumbnail(const std::string& mime, std::uint64_t size, std::uint64_t max_source_bytes) noexcept {
    return is_image_mime(mime) && size < max_source_bytes;
}

} // namespace cirrus::media
