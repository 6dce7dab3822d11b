/**
 * @file cipher.hpp
 * @brief AES-256-GCM with the nonce layout of the upload format
 *
 * WIRE LAYOUT:
 * ciphertext || 16-byte tag
 *
 * NONCES (96 bit):
 * block i    : big-endian u64(i) || 00 00 00 00
 * thumbnail  : all zero (legacy, equals the block-0 nonce) or
 *              00 * 11 || 01 (dedicated, outside the block space)
 */

#pragma once

#include "cirrus/core/config.hpp"
#include "cirrus/core/error.hpp"
#include "cirrus/crypto/encoding.hpp"

#include <array>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <string>

namespace cirrus::crypto {

inline constexpr std::size_t kKeySize = 32;
inline constexpr std::size_t kNonceSize = 12;
inline constexpr std::size_t kTagSize = 16;

/// Largest plaintext one call can seal, bounded by the int lengths of EVP
inline constexpr std::size_t kMaxPlaintextSize = static_cast<std::size_t>(INT_MAX) - kTagSize;

using Nonce = std::array<std::uint8_t, kNonceSize>;
using Key = std::array<std::uint8_t, kKeySize>;

Nonce block_nonce(std::uint64_t index) noexcept;

Nonce thumbnail_nonce(ThumbnailNonceMode mode) noexcept;

/**
 * @brief Content key of one file
 *
 * The key is wiped from memory on destruction.
 */
class ContentCipher {
public:
    /// Fails with ErrorKind::Crypto on bad base64 or a key that is not 32 bytes
    static TransferResult<ContentCipher> from_base64_key(const std::string& encoded);

    static TransferResult<ContentCipher> from_key(const Bytes& raw);

    ContentCipher(const ContentCipher&) = default;
    ContentCipher& operator=(const ContentCipher&) = default;
    ~ContentCipher();

    TransferResult<Bytes> encrypt(const Nonce& nonce, const std::uint8_t* plaintext, std::size_t size) const;

    TransferResult<Bytes> encrypt(const Nonce& nonce, const Bytes& plaintext) const {
        return encrypt(nonce, plaintext.data(), plaintext.size());
    }

    /// Fails when the tag does not authenticate
    TransferResult<Bytes> decrypt(const Nonce& nonce, const Bytes& sealed) const;

private:
    explicit ContentCipher(const Key& key) : key_(key) {}

    Key key_{};
};

} // namespace cirrus::crypto
