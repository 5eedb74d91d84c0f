#include "base64.hpp"
#include <openssl/evp.h>
#include <algorithm>

std::string base64_encode(const std::vector<uint8_t>& data, bool url_safe) {
    if (data.empty()) return std::string();

    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                              data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(len));

    if (url_safe) {
        std::replace(out.begin(), out.end(), '+', '-');
        std::replace(out.begin(), out.end(), '/', '_');
    }
    return out;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& text, bool url_safe) {
    if (text.empty()) return std::vector<uint8_t>();
    if (text.size() % 4 != 0) return std::nullopt;

    std::string in = text;
    for (char& c : in) {
        // EVP_DecodeBlock only knows the standard alphabet
        if (url_safe) {
            if (c == '+' || c == '/') return std::nullopt;
            if (c == '-') c = '+';
            else if (c == '_') c = '/';
        } else if (c == '-' || c == '_') {
            return std::nullopt;
        }
    }

    size_t padding = 0;
    if (in[in.size() - 1] == '=') ++padding;
    if (in[in.size() - 2] == '=') ++padding;
    if (in.find('=') < in.size() - padding) return std::nullopt;

    std::vector<uint8_t> out(3 * (in.size() / 4));
    int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(in.data()),
                              static_cast<int>(in.size()));
    if (len < 0 || static_cast<size_t>(len) < padding) return std::nullopt;

    out.resize(static_cast<size_t>(len) - padding);
    return out;
}
