// src/protocols/wallet_link/include/Command.hpp
#pragma once
#include "protocols/wallet_link/include/Address.hpp"
#include "protocols/wallet_link/include/Transaction.hpp"
#include "types/BasicTypes.hpp"
#include "types/CommandType.hpp"
#include <optional>
#include <string>
#include <variant>

namespace wallet_link::protocol
{
    /**
     * @brief sign-message 명령
     */
    struct SignMessageCommand
    {
        Bytes message;
        std::optional<Address> address;     // 없으면 서명자가 기본 계정 선택
        std::optional<std::string> callback;

        bool operator==(const SignMessageCommand& other) const {
            return message == other.message && address == other.address && callback == other.callback;
        }
    };

    /**
     * @brief sign-personal-message 명령
     */
    struct SignPersonalMessageCommand
    {
        Bytes message;
        std::optional<Address> address;
        std::optional<std::string> callback;

        bool operator==(const SignPersonalMessageCommand& other) const {
            return message == other.message && address == other.address && callback == other.callback;
        }
    };

    /**
     * @brief sign-transaction 명령
     */
    struct SignTransactionCommand
    {
        Transaction transaction;
        std::optional<std::string> callback;

        bool operator==(const SignTransactionCommand& other) const {
            return transaction == other.transaction && callback == other.callback;
        }
    };

    // 변형 순서는 CommandType 값과 동일
    using Command = std::variant<SignMessageCommand, SignPersonalMessageCommand, SignTransactionCommand>;

    CommandType GetCommandType(const Command& command);

    const std::optional<std::string>& GetCallback(const Command& command);

    /**
     * @brief 로그/호스트 출력용 JSON
     *
     * {"type":"sign-message","message":"0x...","address":"0x...","callback":"..."}
     */
    std::string CommandToJson(const Command& command);

    // CommandToJson과 같지만 message/data 대신 바이트 수만 기록
    std::string CommandToLogString(const Command& command);

} // namespace wallet_link::protocol
