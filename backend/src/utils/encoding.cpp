#include "encoding.hpp"
#include <sodium.h>

namespace encoding {

std::string toHex(const unsigned char* data, std::size_t len) {
    std::string hex(2 * len + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), data, len);
    hex.resize(2 * len);
    return hex;
}

std::string toHex(const std::vector<unsigned char>& data) {
    return toHex(data.data(), data.size());
}

bool fromHex(const std::string& hex, std::vector<unsigned char>& out) {
    if (hex.size() % 2 != 0) return false;

    out.resize(hex.size() / 2);
    size_t bin_len = 0;
    if (sodium_hex2bin(out.data(), out.size(),
        hex.c_str(), hex.size(),
        nullptr, &bin_len, nullptr) != 0)
    {
        out.clear();
        return false;
    }
    out.resize(bin_len);
    return true;
}

bool fromBase64Url(const std::string& b64, std::vector<unsigned char>& out) {
    std::string trimmed = b64;
    while (!trimmed.empty() && trimmed.back() == '=') trimmed.pop_back();
    if (trimmed.empty()) return false;

    out.resize(trimmed.size() * 3 / 4 + 1);
    size_t bin_len = 0;
    if (sodium_base642bin(out.data(), out.size(),
        trimmed.c_str(), trimmed.size(),
        nullptr, &bin_len, nullptr,
        sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0)
    {
        out.clear();
        return false;
    }
    out.resize(bin_len);
    return true;
}

std::string toBase64Url(const std::vector<unsigned char>& data) {
    const size_t len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_URLSAFE);
    std::string b64(len, '\0');
    sodium_bin2base64(&b64[0], len, data.data(), data.size(), sodium_base64_VARIANT_URLSAFE);
    b64.resize(len - 1); // drop the terminator
    return b64;
}

}
