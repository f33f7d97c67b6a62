// src/protocols/wallet_link/src/Command.cpp
#include "protocols/wallet_link/include/Command.hpp"
#include "common/utils/encoding/Hex.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace wallet_link::protocol
{
    namespace
    {
        template<typename TMessageCommand>
        json MessageCommandToJson(CommandType type, const TMessageCommand& command)
        {
            json j;
            j["type"] = CommandTypeToHost(type);
            j["message"] = "0x" + utils::HexEncode(command.message);

            if (command.address) {
                j["address"] = command.address->ToString();
            }
            if (command.callback) {
                j["callback"] = *command.callback;
            }
            return j;
        }

        json BuildCommandJson(const Command& command)
        {
            json j;

            if (const auto* sign_message = std::get_if<SignMessageCommand>(&command)) {
                j = MessageCommandToJson(CommandType::SIGN_MESSAGE, *sign_message);
            }
            else if (const auto* personal = std::get_if<SignPersonalMessageCommand>(&command)) {
                j = MessageCommandToJson(CommandType::SIGN_PERSONAL_MESSAGE, *personal);
            }
            else if (const auto* sign_tx = std::get_if<SignTransactionCommand>(&command)) {
                j["type"] = CommandTypeToHost(CommandType::SIGN_TRANSACTION);
                j["transaction"] = json::parse(sign_tx->transaction.ToJson());
                if (sign_tx->callback) {
                    j["callback"] = *sign_tx->callback;
                }
            }

            return j;
        }
    }

    CommandType GetCommandType(const Command& command)
    {
        return static_cast<CommandType>(command.index());
    }

    const std::optional<std::string>& GetCallback(const Command& command)
    {
        return std::visit([](const auto& cmd) -> const std::optional<std::string>& {
            return cmd.callback;
        }, command);
    }

    std::string CommandToJson(const Command& command)
    {
        return BuildCommandJson(command).dump();
    }

    std::string CommandToLogString(const Command& command)
    {
        json j = BuildCommandJson(command);

        // 페이로드는 크기만 남김
        if (const auto* sign_message = std::get_if<SignMessageCommand>(&command)) {
            j.erase("message");
            j["messageSize"] = sign_message->message.size();
        }
        else if (const auto* personal = std::get_if<SignPersonalMessageCommand>(&command)) {
            j.erase("message");
            j["messageSize"] = personal->message.size();
        }
        else if (const auto* sign_tx = std::get_if<SignTransactionCommand>(&command)) {
            if (sign_tx->transaction.payload) {
                j["transaction"].erase("data");
                j["transaction"]["dataSize"] = sign_tx->transaction.payload->size();
            }
        }

        return j.dump();
    }

} // namespace wallet_link::protocol
