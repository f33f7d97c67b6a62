// src/types/CommandType.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace wallet_link
{
    /**
     * @brief URL host로 식별되는 명령 타입
     *
     * 값은 CommandDispatcher 핸들러 테이블의 인덱스로 사용됩니다.
     */
    enum class CommandType : uint32_t
    {
        SIGN_MESSAGE = 0,            // sign-message
        SIGN_PERSONAL_MESSAGE = 1,   // sign-personal-message
        SIGN_TRANSACTION = 2,        // sign-transaction
        MAX_COMMAND_TYPE
    };

    inline const char* CommandTypeToString(CommandType type)
    {
        switch (type) {
            case CommandType::SIGN_MESSAGE:
                return "SIGN_MESSAGE";
            case CommandType::SIGN_PERSONAL_MESSAGE:
                return "SIGN_PERSONAL_MESSAGE";
            case CommandType::SIGN_TRANSACTION:
                return "SIGN_TRANSACTION";
            default:
                return "UNKNOWN";
        }
    }

    inline const char* CommandTypeToHost(CommandType type)
    {
        switch (type) {
            case CommandType::SIGN_MESSAGE:
                return "sign-message";
            case CommandType::SIGN_PERSONAL_MESSAGE:
                return "sign-personal-message";
            case CommandType::SIGN_TRANSACTION:
                return "sign-transaction";
            default:
                return "";
        }
    }

    // host는 대소문자까지 정확히 일치해야 함
    inline std::optional<CommandType> CommandTypeFromHost(const std::string& host)
    {
        if (host == "sign-message") return CommandType::SIGN_MESSAGE;
        if (host == "sign-personal-message") return CommandType::SIGN_PERSONAL_MESSAGE;
        if (host == "sign-transaction") return CommandType::SIGN_TRANSACTION;
        return std::nullopt;
    }
} // namespace wallet_link
