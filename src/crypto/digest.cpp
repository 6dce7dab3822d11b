#include "cirrus/crypto/digest.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace cirrus::crypto {

void Sha256::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 context initialisation failed");
    }
}

Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

void Sha256::update(const std::uint8_t* data, std::size_t size) {
    if (finished_ || size == 0) {
        return;
    }
    EVP_DigestUpdate(ctx_.get(), data, size);
}

std::string Sha256::finish_hex() {
    if (finished_) {
        throw std::logic_error("SHA-256 digest already finished");
    }
    finished_ = true;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    EVP_DigestFinal_ex(ctx_.get(), digest, &length);
    return to_hex(digest, length);
}

std::string sha256_hex(const std::uint8_t* data, std::size_t size) {
    Sha256 hasher;
    hasher.update(data, size);
    return hasher.finish_hex();
}

} // namespace cirrus::crypto
