// src/common/utils/encoding/Hex.cpp
#include "common/utils/encoding/Hex.hpp"

namespace wallet_link::utils
{
    namespace
    {
        int HexValue(char c)
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    }

    std::string HexEncode(const Bytes& data)
    {
        static constexpr char DIGITS[] = "0123456789abcdef";

        std::string out;
        out.reserve(data.size() * 2);
        for (uint8_t b : data) {
            out.push_back(DIGITS[b >> 4]);
            out.push_back(DIGITS[b & 0x0f]);
        }
        return out;
    }

    std::optional<Bytes> HexDecode(const std::string& hex)
    {
        size_t start = 0;
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
            start = 2;
        }

        if ((hex.size() - start) % 2 != 0) {
            return std::nullopt;
        }

        Bytes out;
        out.reserve((hex.size() - start) / 2);

        for (size_t i = start; i < hex.size(); i += 2) {
            int hi = HexValue(hex[i]);
            int lo = HexValue(hex[i + 1]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            out.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }

        return out;
    }

} // namespace wallet_link::utils
