// src/protocols/wallet_link/include/Address.hpp
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace wallet_link::protocol
{
    /**
     * @brief 20바이트 Ethereum 계정 주소
     */
    class Address
    {
    public:
        static constexpr size_t SIZE = 20;
        using Storage = std::array<uint8_t, SIZE>;

        explicit Address(const Storage& bytes) : bytes_(bytes) {}

        /**
         * @brief 주소 문자열 파싱
         *
         * 40자리 hex, "0x"/"0X" 접두사 선택, 대소문자 무관.
         * 길이나 문자가 잘못되면 std::nullopt.
         */
        static std::optional<Address> FromString(const std::string& str);

        const Storage& Data() const { return bytes_; }

        // "0x" + 소문자 hex
        std::string ToString() const;

        bool operator==(const Address& other) const { return bytes_ == other.bytes_; }
        bool operator!=(const Address& other) const { return bytes_ != other.bytes_; }

    private:
        Storage bytes_;
    };

} // namespace wallet_link::protocol
