#include "cirrus/crypto/cipher.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <string>

namespace cirrus::crypto {
namespace {

struct CipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        EVP_CIPHER_CTX_free(ctx);
    }
};

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

CipherContext make_context(const Key& key, const Nonce& nonce, bool encrypting) {
    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return ctx;
    }

    const int enc = encrypting ? 1 : 0;
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1) {
        ctx.reset();
    }
    return ctx;
}

} // namespace

Nonce block_nonce(std::uint64_t index) noexcept {
    Nonce nonce{};
    for (std::size_t i = 0; i < 8; ++i) {
        nonce[i] = static_cast<std::uint8_t>(index >> (56 - 8 * i));
    }
    return nonce;
}

Nonce thumbnail_nonce(ThumbnailNonceMode mode) noexcept {
    Nonce nonce{};
    if (mode == ThumbnailNonceMode::Dedicated) {
        // Block nonces always end in four zero bytes
        nonce[kNonceSize - 1] = 0x01;
    }
    return nonce;
}

TransferResult<ContentCipher> ContentCipher::from_base64_key(const std::string& encoded) {
    auto decoded = base64_decode(encoded);
    if (decoded.is_error()) {
        return Fail<ContentCipher>(ErrorKind::Crypto, "Failed to decode encryption key: " + decoded.error());
    }
    auto cipher = from_key(decoded.value());
    OPENSSL_cleanse(decoded.value().data(), decoded.value().size());
    return cipher;
}

TransferResult<ContentCipher> ContentCipher::from_key(const Bytes& raw) {
    if (raw.size() != kKeySize) {
        return Fail<ContentCipher>(ErrorKind::Crypto, "Invalid encryption key length, must be 32 bytes");
    }
    Key key{};
    std::copy(raw.begin(), raw.end(), key.begin());
    ContentCipher cipher(key);
    OPENSSL_cleanse(key.data(), key.size());
    return Ok<ContentCipher, TransferError>(cipher);
}

ContentCipher::~ContentCipher() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

TransferResult<Bytes> ContentCipher::encrypt(const Nonce& nonce, const std::uint8_t* plaintext, std::size_t size) const {
    if (size > kMaxPlaintextSize) {
        return Fail<Bytes>(ErrorKind::Crypto, "Block too large to encrypt: " + std::to_string(size) + " bytes");
    }
    auto ctx = make_context(key_, nonce, true);
    if (!ctx) {
        return Fail<Bytes>(ErrorKind::Crypto, "Failed to encrypt block");
    }

    Bytes sealed(size + kTagSize);
    int written = 0;
    if (size > 0 &&
        EVP_EncryptUpdate(ctx.get(), sealed.data(), &written, plaintext, static_cast<int>(size)) != 1) {
        return Fail<Bytes>(ErrorKind::Crypto, "Failed to encrypt block");
    }

    int tail = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + written, &tail) != 1) {
        return Fail<Bytes>(ErrorKind::Crypto, "Failed to encrypt block");
    }
    const std::size_t body = static_cast<std::size_t>(written + tail);

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), sealed.data() + body) != 1) {
        return Fail<Bytes>(ErrorKind::Crypto, "Failed to encrypt block");
    }
    sealed.resize(body + kTagSize);
    return Ok<Bytes, TransferError>(std::move(sealed));
}

TransferResult<Bytes> ContentCipher::decrypt(const Nonce& nonce, const Bytes& sealed) const {
    if (sealed.size() < kTagSize) {
        return Fail<Bytes>(ErrorKind::Crypto, "Ciphertext shorter than the authentication tag");
    }
    const std::size_t body = sealed.size() - kTagSize;
    if (body > kMaxPlaintextSize) {
        return Fail<Bytes>(ErrorKind::Crypto, "Block too large to decrypt: " + std::to_string(body) + " bytes");
    }

    auto ctx = make_context(key_, nonce, false);
    if (!ctx) {
        return Fail<Bytes>(ErrorKind::Crypto, "Failed to decrypt block");
    }

    Bytes plain(body);
    int written = 0;
    if (body > 0 &&
        EVP_DecryptUpdate(ctx.get(), plain.data(), &written, sealed.data(), static_cast<int>(body)) != 1) {
        return Fail<Bytes>(ErrorKind::Crypto, "Failed to decrypt block");
    }

    Bytes tag(sealed.end() - static_cast<std::ptrdiff_t>(kTagSize), sealed.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
        return Fail<Bytes>(ErrorKind::Crypto, "Failed to decrypt block");
    }

    int tail = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + written, &tail) != 1) {
        return Fail<Bytes>(ErrorKind::Crypto, "Authentication tag mismatch");
    }
    plain.resize(static_cast<std::size_t>(written + tail));
    return Ok<Bytes, TransferError>(std::move(plain));
}

} // namespace cirrus::crypto
