#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Standard alphabet, padded, no line breaks (OpenSSL EVP block coding)
std::string base64Encode(const unsigned char* data, size_t len);

inline std::string base64Encode(const std::string& data) {
    return base64Encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

/**
 * Strict decode: length must be a multiple of 4, only alphabet characters,
 * at most two trailing '='. Returns nullopt on any violation.
 */
std::optional<std::vector<unsigned char>> base64Decode(std::string_view text);

} // namespace core
