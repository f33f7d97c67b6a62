// src/common/utils/encoding/Base64.cpp
#include "common/utils/encoding/Base64.hpp"
#include <openssl/evp.h>
#include <climits>
#include <stdexcept>

namespace wallet_link::utils
{
    namespace
    {
        bool IsBase64Char(unsigned char c)
        {
            return (c >= 'A' && c <= 'Z') ||
                   (c >= 'a' && c <= 'z') ||
                   (c >= '0' && c <= '9') ||
                   c == '+' || c == '/';
        }
    }

    std::string Base64Encode(const Bytes& data)
    {
        if (data.empty()) {
            return "";
        }

        if (data.size() > static_cast<size_t>(INT_MAX / 4 * 3)) {
            throw std::length_error("Base64Encode: input too large");
        }

        // EVP_EncodeBlock은 NUL 종료 문자까지 기록
        std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
        int written = EVP_EncodeBlock(
            reinterpret_cast<unsigned char*>(&encoded[0]),
            data.data(),
            static_cast<int>(data.size()));

        encoded.resize(static_cast<size_t>(written));
        return encoded;
    }

    std::optional<Bytes> Base64Decode(const std::string& encoded)
    {
        if (encoded.empty()) {
            return Bytes{};
        }

        if (encoded.size() % 4 != 0 || encoded.size() > static_cast<size_t>(INT_MAX)) {
            return std::nullopt;
        }

        size_t padding = 0;
        for (size_t i = 0; i < encoded.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(encoded[i]);

            if (c == '=') {
                // 패딩은 마지막 두 자리 안에서만, 그 뒤로는 패딩만
                if (i < encoded.size() - 2) {
                    return std::nullopt;
                }
                ++padding;
                continue;
            }

            if (padding > 0 || !IsBase64Char(c)) {
                return std::nullopt;
            }
        }

        Bytes decoded(encoded.size() / 4 * 3);
        int written = EVP_DecodeBlock(
            decoded.data(),
            reinterpret_cast<const unsigned char*>(encoded.data()),
            static_cast<int>(encoded.size()));

        if (written < 0 || static_cast<size_t>(written) < padding) {
            return std::nullopt;
        }

        // EVP_DecodeBlock은 패딩 자리를 0으로 채워서 반환
        decoded.resize(static_cast<size_t>(written) - padding);
        return decoded;
    }

} // namespace wallet_link::utils
