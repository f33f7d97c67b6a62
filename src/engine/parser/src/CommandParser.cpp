// src/engine/parser/src/CommandParser.cpp
#include "engine/parser/include/CommandParser.hpp"
#include "common/utils/encoding/Base64.hpp"
#include "common/utils/encoding/Hex.hpp"
#include "common/utils/logger/Logger.hpp"
#include "types/BasicTypes.hpp"
#include <charconv>

namespace wallet_link::engine
{
    using namespace wallet_link::protocol;
    using wallet_link::utils::BigInt;

    const char* ParseStatusToString(ParseStatus status)
    {
        switch (status) {
            case ParseStatus::UNHANDLED:
                return "UNHANDLED";
            case ParseStatus::INVALID_REQUEST:
                return "INVALID_REQUEST";
            case ParseStatus::PARSED:
                return "PARSED";
            default:
                return "UNKNOWN";
        }
    }

    ParseResult CommandParser::Parse(const std::string& command_url)
    {
        std::optional<url::UrlComponents> components = url::UrlComponents::Parse(command_url);
        if (!components) {
            LOG_DEBUG("CommandParser", "URL cannot be decomposed, not handled");
            return ParseResult{};
        }

        if (!components->Host()) {
            LOG_DEBUG("CommandParser", "URL has no host, not handled");
            return ParseResult{};
        }

        std::optional<CommandType> type = CommandTypeFromHost(*components->Host());
        if (!type) {
            LOG_DEBUGF("CommandParser", "Unknown command host: %s", components->Host()->c_str());
            return ParseResult{};
        }

        switch (*type) {
            case CommandType::SIGN_MESSAGE:
            case CommandType::SIGN_PERSONAL_MESSAGE:
                return ParseMessageCommand(*type, *components);
            case CommandType::SIGN_TRANSACTION:
                return ParseTransactionCommand(*components);
            default:
                return ParseResult{};
        }
    }

    ParseResult CommandParser::ParseMessageCommand(CommandType type, const url::UrlComponents& components)
    {
        std::optional<std::string> callback = ParseCallback(components);

        std::optional<std::string> encoded = components.QueryValue(params::MESSAGE);
        if (!encoded) {
            LOG_WARNF("CommandParser", "%s: missing message", CommandTypeToHost(type));
            return Invalid(type, std::move(callback));
        }

        std::optional<Bytes> message = utils::Base64Decode(*encoded);
        if (!message) {
            LOG_WARNF("CommandParser", "%s: message is not valid base64", CommandTypeToHost(type));
            return Invalid(type, std::move(callback));
        }

        // 주소가 없거나 잘못되면 서명자 기본 계정 사용
        std::optional<Address> address;
        if (std::optional<std::string> address_str = components.QueryValue(params::ADDRESS)) {
            address = Address::FromString(*address_str);
            if (!address) {
                LOG_DEBUGF("CommandParser", "Ignoring malformed address: %s", address_str->c_str());
            }
        }

        ParseResult result;
        result.status = ParseStatus::PARSED;
        result.type = type;
        result.callback = callback;

        if (type == CommandType::SIGN_MESSAGE) {
            result.command = SignMessageCommand{ std::move(*message), address, callback };
        } else {
            result.command = SignPersonalMessageCommand{ std::move(*message), address, callback };
        }

        return result;
    }

    ParseResult CommandParser::ParseTransactionCommand(const url::UrlComponents& components)
    {
        const CommandType type = CommandType::SIGN_TRANSACTION;
        std::optional<std::string> callback = ParseCallback(components);

        std::optional<BigInt> gas_price;
        if (auto value = components.QueryValue(params::GAS_PRICE)) {
            gas_price = BigInt::FromDecimalString(*value);
        }

        std::optional<uint64_t> gas_limit;
        if (auto value = components.QueryValue(params::GAS_LIMIT)) {
            gas_limit = ParseUInt64(*value);
        }

        std::optional<Address> to;
        if (auto value = components.QueryValue(params::TO)) {
            to = Address::FromString(*value);
        }

        std::optional<BigInt> amount;
        if (auto value = components.QueryValue(params::AMOUNT)) {
            amount = BigInt::FromDecimalString(*value);
        }

        if (!gas_price || !gas_limit || !to || !amount) {
            LOG_WARNF("CommandParser", "sign-transaction: invalid or missing field (gasPrice=%s gasLimit=%s to=%s amount=%s)",
                gas_price ? "ok" : "bad", gas_limit ? "ok" : "bad", to ? "ok" : "bad", amount ? "ok" : "bad");
            return Invalid(type, std::move(callback));
        }

        // nonce: 없거나 파싱 불가면 0
        BigInt nonce;
        if (auto value = components.QueryValue(params::NONCE)) {
            if (auto parsed = BigInt::FromDecimalString(*value)) {
                nonce = *parsed;
            }
        }

        // data: 디코딩 실패 시 페이로드 없음
        std::optional<Bytes> payload;
        if (auto value = components.QueryValue(params::DATA)) {
            payload = utils::HexDecode(*value);
            if (!payload) {
                LOG_DEBUG("CommandParser", "Ignoring undecodable transaction data");
            }
        }

        Transaction transaction{
            std::move(nonce),
            std::move(*gas_price),
            BigInt::FromUInt64(*gas_limit),
            *to,
            std::move(*amount),
            std::move(payload)
        };

        ParseResult result;
        result.status = ParseStatus::PARSED;
        result.type = type;
        result.callback = callback;
        result.command = SignTransactionCommand{ std::move(transaction), callback };
        return result;
    }

    std::optional<std::string> CommandParser::ParseCallback(const url::UrlComponents& components)
    {
        std::optional<std::string> value = components.QueryValue(params::CALLBACK);
        if (!value) {
            return std::nullopt;
        }

        std::optional<url::UrlComponents> callback = url::UrlComponents::Parse(*value);
        if (!callback || !callback->IsAbsolute()) {
            LOG_WARNF("CommandParser", "Ignoring invalid callback URL: %s", value->c_str());
            return std::nullopt;
        }

        return *value;
    }

    std::optional<uint64_t> CommandParser::ParseUInt64(const std::string& str)
    {
        if (str.empty()) {
            return std::nullopt;
        }

        uint64_t value = 0;
        const char* first = str.data();
        const char* last = str.data() + str.size();

        // from_chars는 부호를 받지 않으므로 '+' 하나만 직접 처리, '-'는 거부
        if (*first == '+') {
            ++first;
            if (first == last) {
                return std::nullopt;
            }
        }

        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            return std::nullopt;
        }

        return value;
    }

    ParseResult CommandParser::Invalid(CommandType type, std::optional<std::string> callback)
    {
        ParseResult result;
        result.status = ParseStatus::INVALID_REQUEST;
        result.type = type;
        result.callback = std::move(callback);
        return result;
    }

} // namespace wallet_link::engine
