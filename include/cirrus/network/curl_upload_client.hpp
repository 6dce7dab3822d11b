#pragma once

#include "cirrus/network/upload_client.hpp"

#include <curl/curl.h>

#include <memory>

namespace cirrus::network {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

using unique_curl_easy = std::unique_ptr<CURL, CurlEasyDeleter>;
using unique_curl_slist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

/**
 * @brief UploadClient on libcurl
 *
 * A fresh easy handle per request; curl_global_init() runs once per
 * process on first construction.
 */
class CurlUploadClient : public UploadClient {
public:
    CurlUploadClient();

    Result<long> put(const std::string& url,
                     const std::vector<std::uint8_t>& body,
                     const std::string& content_type,
                     std::chrono::seconds timeout) override;
};

} // namespace cirrus::network
