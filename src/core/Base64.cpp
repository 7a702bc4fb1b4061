#include "core/Base64.hpp"

#include <openssl/evp.h>

#include <climits>

namespace core {

namespace {

bool isAlphabet(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

} // namespace

std::string base64Encode(const unsigned char* data, size_t len) {
    if (len == 0) return {};

    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                                        static_cast<int>(len));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

std::optional<std::vector<unsigned char>> base64Decode(std::string_view text) {
    if (text.empty() || text.size() % 4 != 0 || text.size() > static_cast<size_t>(INT_MAX)) {
        return std::nullopt;
    }

    size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;

    for (size_t i = 0; i < text.size() - padding; ++i) {
        if (!isAlphabet(text[i])) return std::nullopt;
    }
    if (padding == 1 && text[text.size() - 2] == '=') return std::nullopt;

    std::vector<unsigned char> out(3 * (text.size() / 4));
    const int decoded = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts the padding as zero bytes
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

} // namespace core
