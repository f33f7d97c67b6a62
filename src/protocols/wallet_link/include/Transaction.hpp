// src/protocols/wallet_link/include/Transaction.hpp
#pragma once
#include "protocols/wallet_link/include/Address.hpp"
#include "common/utils/bigint/BigInt.hpp"
#include "types/BasicTypes.hpp"
#include <optional>
#include <string>

namespace wallet_link::protocol
{
    /**
     * @brief 서명자에게 전달되는 Ethereum 트랜잭션
     *
     * gas_limit은 URL에서 uint64로 파싱된 뒤 BigInt로 확장됨.
     */
    struct Transaction
    {
        utils::BigInt nonce;
        utils::BigInt gas_price;
        utils::BigInt gas_limit;
        Address to;
        utils::BigInt amount;
        std::optional<Bytes> payload;

        // 숫자는 10진 문자열, 바이트는 "0x" hex
        std::string ToJson() const;

        bool operator==(const Transaction& other) const;
        bool operator!=(const Transaction& other) const { return !(*this == other); }
    };

} // namespace wallet_link::protocol
