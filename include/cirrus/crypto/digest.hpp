#pragma once

#include "cirrus/crypto/encoding.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

struct evp_md_ctx_st;

namespace cirrus::crypto {

/**
 * @brief Incremental SHA-256
 *
 * Feed any number of update() calls, then finish_hex() once. The object
 * cannot be reused after finishing.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    void update(const std::uint8_t* data, std::size_t size);
    void update(const Bytes& data) { update(data.data(), data.size()); }

    /// Lowercase hex digest
    std::string finish_hex();

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
    bool finished_ = false;
};

std::string sha256_hex(const std::uint8_t* data, std::size_t size);

inline std::string sha256_hex(const Bytes& data) {
    return sha256_hex(data.data(), data.size());
}

} // namespace cirrus::crypto
