// src/protocols/wallet_link/src/Address.cpp
#include "protocols/wallet_link/include/Address.hpp"
#include "common/utils/encoding/Hex.hpp"
#include <algorithm>

namespace wallet_link::protocol
{
    std::optional<Address> Address::FromString(const std::string& str)
    {
        std::optional<Bytes> decoded = utils::HexDecode(str);
        if (!decoded || decoded->size() != SIZE) {
            return std::nullopt;
        }

        Storage bytes{};
        std::copy(decoded->begin(), decoded->end(), bytes.begin());
        return Address(bytes);
    }

    std::string Address::ToString() const
    {
        return "0x" + utils::HexEncode(Bytes(bytes_.begin(), bytes_.end()));
    }

} // namespace wallet_link::protocol
