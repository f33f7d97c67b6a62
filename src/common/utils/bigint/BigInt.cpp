// src/common/utils/bigint/BigInt.cpp
#include "common/utils/bigint/BigInt.hpp"
#include <openssl/crypto.h>
#include <stdexcept>

namespace wallet_link::utils
{
    BigInt::BigInt()
        : bn_(BN_new())
    {
        if (!bn_) {
            throw std::runtime_error("BigInt: BN_new failed");
        }
    }

    BigInt::BigInt(BIGNUM* bn)
        : bn_(bn)
    {
        if (!bn_) {
            throw std::runtime_error("BigInt: null BIGNUM");
        }
    }

    BigInt::BigInt(const BigInt& other)
        : bn_(BN_dup(other.bn_.get()))
    {
        if (!bn_) {
            throw std::runtime_error("BigInt: BN_dup failed");
        }
    }

    BigInt& BigInt::operator=(const BigInt& other)
    {
        if (this != &other) {
            BIGNUM* copy = BN_dup(other.bn_.get());
            if (!copy) {
                throw std::runtime_error("BigInt: BN_dup failed");
            }
            bn_.reset(copy);
        }
        return *this;
    }

    std::optional<BigInt> BigInt::FromDecimalString(const std::string& str)
    {
        // BN_dec2bn은 '+'를 모르므로 떼어내고 넘김
        const std::string digits = (!str.empty() && str[0] == '+') ? str.substr(1) : str;

        size_t start = (!digits.empty() && digits[0] == '-') ? 1 : 0;
        if (digits.size() == start || (start == 1 && str[0] == '+')) {
            return std::nullopt;
        }

        for (size_t i = start; i < digits.size(); ++i) {
            if (digits[i] < '0' || digits[i] > '9') {
                return std::nullopt;
            }
        }

        BIGNUM* raw = nullptr;
        int consumed = BN_dec2bn(&raw, digits.c_str());
        if (consumed <= 0 || !raw) {
            BN_free(raw);
            return std::nullopt;
        }

        if (static_cast<size_t>(consumed) != digits.size()) {
            BN_free(raw);
            return std::nullopt;
        }

        return BigInt(raw);
    }

    BigInt BigInt::FromUInt64(uint64_t value)
    {
        // BN_ULONG 폭에 의존하지 않도록 big-endian 바이트로 설정
        unsigned char buffer[8];
        for (int i = 7; i >= 0; --i) {
            buffer[i] = static_cast<unsigned char>(value & 0xff);
            value >>= 8;
        }

        BIGNUM* raw = BN_bin2bn(buffer, sizeof(buffer), nullptr);
        if (!raw) {
            throw std::runtime_error("BigInt: BN_bin2bn failed");
        }
        return BigInt(raw);
    }

    std::string BigInt::ToDecimalString() const
    {
        char* dec = BN_bn2dec(bn_.get());
        if (!dec) {
            throw std::runtime_error("BigInt: BN_bn2dec failed");
        }

        std::string result(dec);
        OPENSSL_free(dec);
        return result;
    }

    Bytes BigInt::ToBigEndianBytes() const
    {
        Bytes out(static_cast<size_t>(BN_num_bytes(bn_.get())));
        if (!out.empty()) {
            BN_bn2bin(bn_.get(), out.data());
        }
        return out;
    }

    bool BigInt::IsZero() const
    {
        return BN_is_zero(bn_.get());
    }

    bool BigInt::IsNegative() const
    {
        return BN_is_negative(bn_.get());
    }

    bool BigInt::operator==(const BigInt& other) const
    {
        return BN_cmp(bn_.get(), other.bn_.get()) == 0;
    }

    bool BigInt::operator<(const BigInt& other) const
    {
        return BN_cmp(bn_.get(), other.bn_.get()) < 0;
    }

} // namespace wallet_link::utils
