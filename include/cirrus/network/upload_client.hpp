#pragma once

#include "cirrus/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace cirrus::network {

/**
 * @brief Transport for pre-authorised PUT uploads
 *
 * One call is one attempt; retries belong to the caller. Implementations
 * must be safe to call from the engine worker thread while other threads
 * use the engine.
 */
class UploadClient {
public:
    virtual ~UploadClient() = default;

    /**
     * @brief PUT body to url
     *
     * RETURNS:
     * The HTTP status code when a response arrived (any status), or an
     * error describing the transport failure.
     */
    virtual Result<long> put(const std::string& url,
                             const std::vector<std::uint8_t>& body,
                             const std::string& content_type,
                             std::chrono::seconds timeout) = 0;
};

inline bool is_success_status(long status) noexcept {
    return status >= 200 && status < 300;
}

} // namespace cirrus::network
