#include "cirrus/crypto/cipher.hpp"
#include "cirrus/crypto/digest.hpp"
#include "cirrus/crypto/encoding.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace cirrus::crypto;
using cirrus::ErrorKind;
using cirrus::ThumbnailNonceMode;

namespace {

Bytes test_key() {
    Bytes key(kKeySize);
    for (std::size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<std::uint8_t>(i * 7 + 3);
    }
    return key;
}

Bytes text_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

} // namespace

TEST(CipherTest, BlockRoundTripRestoresPlaintext) {
    auto cipher = ContentCipher::from_key(test_key());
    ASSERT_TRUE(cipher.is_ok());

    const Bytes plain = text_bytes("block payload that spans a few words");
    const Nonce nonce = block_nonce(41);

    auto sealed = cipher.value().encrypt(nonce, plain);
    ASSERT_TRUE(sealed.is_ok());
    EXPECT_EQ(sealed.value().size(), plain.size() + kTagSize);
    EXPECT_NE(Bytes(sealed.value().begin(), sealed.value().end() - kTagSize), plain);

    auto opened = cipher.value().decrypt(nonce, sealed.value());
    ASSERT_TRUE(opened.is_ok());
    EXPECT_EQ(opened.value(), plain);
}

TEST(CipherTest, DecryptRejectsWrongNonceAndTamperedTag) {
    auto cipher = ContentCipher::from_key(test_key());
    ASSERT_TRUE(cipher.is_ok());

    auto sealed = cipher.value().encrypt(block_nonce(1), text_bytes("secret"));
    ASSERT_TRUE(sealed.is_ok());

    EXPECT_TRUE(cipher.value().decrypt(block_nonce(2), sealed.value()).is_error());

    Bytes tampered = sealed.value();
    tampered.back() ^= 0x01;
    auto result = cipher.value().decrypt(block_nonce(1), tampered);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Crypto);
}

TEST(CipherTest, BlockNonceIsBigEndianIndexThenZeros) {
    const Nonce nonce = block_nonce(0x0102030405060708ULL);
    const Nonce expected = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x00, 0x00, 0x00, 0x00};
    EXPECT_EQ(nonce, expected);

    const Nonce small = block_nonce(3);
    EXPECT_EQ(small[7], 0x03);
    EXPECT_EQ(small[0], 0x00);
}

TEST(CipherTest, LegacyThumbnailNonceCollidesWithFirstBlock) {
    // Deployed decryptors expect this layout, so it stays the default
    EXPECT_EQ(thumbnail_nonce(ThumbnailNonceMode::LegacyZero), block_nonce(0));
}

TEST(CipherTest, DedicatedThumbnailNonceNeverMatchesABlockNonce) {
    const Nonce thumb = thumbnail_nonce(ThumbnailNonceMode::Dedicated);
    for (std::uint64_t index : {0ULL, 1ULL, 255ULL, 1ULL << 32, ~0ULL}) {
        EXPECT_NE(thumb, block_nonce(index)) << "index " << index;
    }

    // Distinct plaintexts under one key never share a nonce in this mode
    auto cipher = ContentCipher::from_key(test_key());
    ASSERT_TRUE(cipher.is_ok());
    std::set<Nonce> used;
    for (std::uint64_t index = 0; index < 64; ++index) {
        used.insert(block_nonce(index));
    }
    EXPECT_EQ(used.count(thumb), 0u);
}

TEST(CipherTest, KeyValidation) {
    auto short_key = ContentCipher::from_key(Bytes(16, 0xAA));
    ASSERT_TRUE(short_key.is_error());
    EXPECT_EQ(short_key.error().kind, ErrorKind::Crypto);
    EXPECT_EQ(short_key.error().message, "Invalid encryption key length, must be 32 bytes");

    auto bad_base64 = ContentCipher::from_base64_key("not base64!");
    ASSERT_TRUE(bad_base64.is_error());
    EXPECT_EQ(bad_base64.error().message.rfind("Failed to decode encryption key", 0), 0u);

    auto good = ContentCipher::from_base64_key(base64_encode(test_key()));
    EXPECT_TRUE(good.is_ok());
}

TEST(DigestTest, KnownVectors) {
    EXPECT_EQ(sha256_hex(Bytes{}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex(text_bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, StreamingMatchesOneShot) {
    const Bytes data = text_bytes("The quick brown fox jumps over the lazy dog");

    Sha256 hasher;
    hasher.update(data.data(), 10);
    hasher.update(data.data() + 10, data.size() - 10);
    EXPECT_EQ(hasher.finish_hex(), sha256_hex(data));
    EXPECT_EQ(sha256_hex(data), "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

TEST(CipherTest, OversizedBlockIsRefusedBeforeEncrypting) {
    auto cipher = ContentCipher::from_key(test_key());
    ASSERT_TRUE(cipher.is_ok());

    // The length check comes first, so the buffer behind it is never read
    const std::uint8_t byte = 0;
    auto sealed = cipher.value().encrypt(block_nonce(0), &byte, kMaxPlaintextSize + 1);
    ASSERT_TRUE(sealed.is_error());
    EXPECT_EQ(sealed.error().kind, ErrorKind::Crypto);
    EXPECT_EQ(sealed.error().message.rfind("Block too large to encrypt", 0), 0u);
}
