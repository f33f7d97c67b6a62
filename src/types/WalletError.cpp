// src/types/WalletError.cpp
#include "types/WalletError.hpp"
#include <array>
#include <utility>

namespace wallet_link
{
    namespace
    {
        constexpr std::array<std::pair<WalletError, const char*>, 7> ERROR_NAMES = {{
            { WalletError::NONE,                "none" },
            { WalletError::UNKNOWN,             "unknown" },
            { WalletError::INVALID_REQUEST,     "invalidRequest" },
            { WalletError::WATCH_ONLY,          "watchOnly" },
            { WalletError::CANCELLED,           "cancelled" },
            { WalletError::UNSUPPORTED_ADDRESS, "unsupportedAddress" },
            { WalletError::SIGNING_FAILED,      "signingFailed" }
        }};
    }

    const char* WalletErrorToString(WalletError error)
    {
        for (const auto& entry : ERROR_NAMES) {
            if (entry.first == error) {
                return entry.second;
            }
        }
        return "unknown";
    }

    std::optional<WalletError> WalletErrorFromString(const std::string& str)
    {
        for (const auto& entry : ERROR_NAMES) {
            if (str == entry.second) {
                return entry.first;
            }
        }

        // 숫자 코드 형식 ("1", "-1")
        for (const auto& entry : ERROR_NAMES) {
            if (str == std::to_string(WalletErrorToCode(entry.first))) {
                return entry.first;
            }
        }

        return std::nullopt;
    }

} // namespace wallet_link
