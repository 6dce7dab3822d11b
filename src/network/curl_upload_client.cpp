#include "cirrus/network/curl_upload_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <mutex>

namespace cirrus::network {
namespace {

struct ReadCursor {
    const std::uint8_t* data = nullptr;
    std::size_t size = 0;
    std::size_t offset = 0;
};

size_t read_body(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* cursor = static_cast<ReadCursor*>(userdata);
    const std::size_t capacity = size * nitems;
    const std::size_t count = std::min(capacity, cursor->size - cursor->offset);
    if (count > 0) {
        std::memcpy(buffer, cursor->data + cursor->offset, count);
        cursor->offset += count;
    }
    return count;
}

size_t discard_response(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

} // namespace

CurlUploadClient::CurlUploadClient() {
    static std::once_flag init_flag;
    std::call_once(init_flag, []() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            spdlog::error("[Upload] curl_global_init failed: {}", curl_easy_strerror(code));
        }
    });
}

Result<long> CurlUploadClient::put(const std::string& url,
                                   const std::vector<std::uint8_t>& body,
                                   const std::string& content_type,
                                   std::chrono::seconds timeout) {
    unique_curl_easy curl(curl_easy_init());
    if (!curl) {
        return Err<long>(std::string("curl_easy_init failed"));
    }

    unique_curl_slist headers(curl_slist_append(nullptr, ("Content-Type: " + content_type).c_str()));
    if (!headers) {
        return Err<long>(std::string("Failed to build request headers"));
    }

    ReadCursor cursor{body.data(), body.size(), 0};
    char error_buffer[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, read_body);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &cursor);
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_response);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count() * 1000));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    const CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        const char* detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code);
        return Err<long>(std::string("Upload request failed: ") + detail);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    spdlog::debug("[Upload] PUT bytes={} status={}", body.size(), status);
    return Ok(status);
}

} // namespace cirrus::network
