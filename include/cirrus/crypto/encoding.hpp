#pragma once

#include "cirrus/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cirrus::crypto {

using Bytes = std::vector<std::uint8_t>;

/**
 * @brief Decode standard (RFC 4648) base64
 *
 * Whitespace is not accepted. Input length must be a multiple of four and
 * padding may only appear at the end.
 */
Result<Bytes> base64_decode(const std::string& text);

std::string base64_encode(const Bytes& data);

/// Lowercase hexadecimal rendering
std::string to_hex(const std::uint8_t* data, std::size_t size);

inline std::string to_hex(const Bytes& data) {
    return to_hex(data.data(), data.size());
}

} // namespace cirrus::crypto
