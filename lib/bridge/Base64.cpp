/**
 * @file Base64.cpp
 * @brief Base64 codec on OpenSSL EVP blocks with strict padding checks
 */

#include "Base64.h"

#include <openssl/evp.h>

#include <vector>

namespace BLEBridge { namespace Base64 {

namespace {

    bool isAlphabet(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
    }

}

std::string encode(const RNS::Bytes& data) {
    if (data.size() == 0) {
        return std::string();
    }
    std::vector<unsigned char> buf(4 * ((data.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(buf.data(), data.data(), static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(buf.data()), len);
}

bool decode(const std::string& text, RNS::Bytes& out) {
    if (text.empty()) {
        out.clear();
        return true;
    }
    if (text.size() % 4 != 0) {
        return false;
    }

    // Padding is only legal as a final run of one or two '='
    size_t padding = 0;
    while (padding < text.size() && text[text.size() - 1 - padding] == '=') {
        ++padding;
    }
    if (padding > 2) {
        return false;
    }
    for (size_t i = 0; i < text.size() - padding; ++i) {
        if (!isAlphabet(text[i])) {
            return false;
        }
    }

    std::vector<unsigned char> buf(3 * text.size() / 4 + 1);
    int len = EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(text.data()),
                              static_cast<int>(text.size()));
    if (len < 0) {
        return false;
    }

    // EVP_DecodeBlock counts the padding as zero bytes
    out = RNS::Bytes(buf.data(), static_cast<size_t>(len) - padding);
    return true;
}

}} // namespace BLEBridge::Base64
