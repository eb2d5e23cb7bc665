#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace qsde::utils {

class HashUtils {
public:
    using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    static DigestContext newContext() {
        return DigestContext(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    }

    static std::string toHex(const unsigned char* data, size_t length) {
        std::ostringstream oss;
        for (size_t i = 0; i < length; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
        }
        return oss.str();
    }

    // Lowercase, surrounding whitespace removed
    static std::string normalizeHex(std::string_view hex) {
        size_t begin = 0;
        size_t end = hex.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(hex[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(hex[end - 1]))) --end;

        std::string out(hex.substr(begin, end - begin));
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    // Compares every byte regardless of where the first difference is
    static bool constantTimeEquals(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        if (a.empty()) return true;
        return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    static std::string digestString(std::string_view data, const EVP_MD* md) {
        auto ctx = newContext();
        if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) return "";
        if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return "";

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) return "";
        return toHex(hash, hashLen);
    }

    static std::string sha256String(std::string_view data) {
        return digestString(data, EVP_sha256());
    }
};

} // namespace qsde::utils
