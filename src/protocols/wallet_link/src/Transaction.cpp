// src/protocols/wallet_link/src/Transaction.cpp
#include "protocols/wallet_link/include/Transaction.hpp"
#include "common/utils/encoding/Hex.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace wallet_link::protocol
{
    std::string Transaction::ToJson() const
    {
        json j;

        j["nonce"] = nonce.ToDecimalString();
        j["gasPrice"] = gas_price.ToDecimalString();
        j["gasLimit"] = gas_limit.ToDecimalString();
        j["to"] = to.ToString();
        j["amount"] = amount.ToDecimalString();

        if (payload) {
            j["data"] = "0x" + utils::HexEncode(*payload);
        }

        return j.dump();
    }

    bool Transaction::operator==(const Transaction& other) const
    {
        return nonce == other.nonce &&
               gas_price == other.gas_price &&
               gas_limit == other.gas_limit &&
               to == other.to &&
               amount == other.amount &&
               payload == other.payload;
    }

} // namespace wallet_link::protocol
