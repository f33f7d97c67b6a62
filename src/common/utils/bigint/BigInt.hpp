// src/common/utils/bigint/BigInt.hpp
#pragma once
#include "types/BasicTypes.hpp"
#include <openssl/bn.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace wallet_link::utils
{
    /**
     * @brief OpenSSL BIGNUM 기반 임의 정밀도 정수
     *
     * 트랜잭션의 nonce, gasPrice, gasLimit, amount 표현에 사용.
     * 값 의미론(복사 시 BN_dup)을 가지며, 메모리 할당 실패 시 std::runtime_error.
     */
    class BigInt
    {
    public:
        BigInt();  // 0
        BigInt(const BigInt& other);
        BigInt& operator=(const BigInt& other);
        BigInt(BigInt&& other) noexcept = default;
        BigInt& operator=(BigInt&& other) noexcept = default;
        ~BigInt() = default;

        /**
         * @brief 10진수 문자열 파싱
         *
         * 허용 형식: 선택적 '+' 또는 '-' 다음 하나 이상의 ASCII 숫자. 공백, 기타 문자는 거부.
         */
        static std::optional<BigInt> FromDecimalString(const std::string& str);

        static BigInt FromUInt64(uint64_t value);

        std::string ToDecimalString() const;

        // 절댓값의 big-endian 바이트 (0이면 빈 배열)
        Bytes ToBigEndianBytes() const;

        bool IsZero() const;
        bool IsNegative() const;

        bool operator==(const BigInt& other) const;
        bool operator!=(const BigInt& other) const { return !(*this == other); }
        bool operator<(const BigInt& other) const;

    private:
        struct BignumDeleter
        {
            void operator()(BIGNUM* bn) const { BN_free(bn); }
        };

        explicit BigInt(BIGNUM* bn);

        std::unique_ptr<BIGNUM, BignumDeleter> bn_;
    };

} // namespace wallet_link::utils
