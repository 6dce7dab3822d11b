#include "cirrus/crypto/encoding.hpp"

#include <openssl/evp.h>

#include <cctype>

namespace cirrus::crypto {

Result<Bytes> base64_decode(const std::string& text) {
    if (text.empty()) {
        return Ok(Bytes{});
    }
    if (text.size() % 4 != 0) {
        return Err<Bytes>(std::string("base64 length is not a multiple of 4"));
    }

    std::size_t padding = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return Err<Bytes>(std::string("base64 padding in the middle of input"));
        }
        if (!std::isalnum(c) && c != '+' && c != '/') {
            return Err<Bytes>(std::string("invalid base64 character"));
        }
    }
    if (padding > 2) {
        return Err<Bytes>(std::string("invalid base64 padding"));
    }

    // EVP_DecodeBlock ignores padding and always yields 3 bytes per quartet
    Bytes decoded(text.size() / 4 * 3);
    const int written = EVP_DecodeBlock(decoded.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        return Err<Bytes>(std::string("invalid base64 input"));
    }
    decoded.resize(static_cast<std::size_t>(written) - padding);
    return Ok(std::move(decoded));
}

std::string base64_encode(const Bytes& data) {
    if (data.empty()) {
        return {};
    }
    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                        data.data(),
                                        static_cast<int>(data.size()));
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

std::string to_hex(const std::uint8_t* data, std::size_t size) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

} // namespace cirrus::crypto
