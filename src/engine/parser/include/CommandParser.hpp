// src/engine/parser/include/CommandParser.hpp
#pragma once
#include "common/url/include/UrlComponents.hpp"
#include "protocols/wallet_link/include/Command.hpp"
#include "types/CommandType.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace wallet_link::engine
{
    enum class ParseStatus
    {
        UNHANDLED = 0,        // 이 프로토콜의 URL이 아님
        INVALID_REQUEST = 1,  // 인식된 명령이지만 필수 필드 누락/디코딩 실패
        PARSED = 2
    };

    const char* ParseStatusToString(ParseStatus status);

    /**
     * @brief 명령 URL 파싱 결과
     *
     * - UNHANDLED: type, command, callback 모두 의미 없음
     * - INVALID_REQUEST: type, callback 유효 (실패 콜백 전달용), command 없음
     * - PARSED: type, command 유효, callback은 command 안의 값과 동일
     */
    struct ParseResult
    {
        ParseStatus status = ParseStatus::UNHANDLED;
        CommandType type = CommandType::MAX_COMMAND_TYPE;
        std::optional<protocol::Command> command;
        std::optional<std::string> callback;

        bool IsHandled() const { return status != ParseStatus::UNHANDLED; }
    };

    /**
     * @brief 인바운드 명령 URL → 타입이 있는 Command
     *
     * 순수 함수: I/O 없음, 예외 없음, 항상 결과 반환.
     * 같은 URL은 항상 같은 결과를 만든다.
     */
    class CommandParser
    {
    public:
        static ParseResult Parse(const std::string& command_url);

    private:
        CommandParser() = delete;

        static ParseResult ParseMessageCommand(CommandType type, const url::UrlComponents& components);
        static ParseResult ParseTransactionCommand(const url::UrlComponents& components);

        // 잘못된 콜백 URL은 없는 것으로 취급
        static std::optional<std::string> ParseCallback(const url::UrlComponents& components);

        // 부호 없는 10진수, uint64 범위
        static std::optional<uint64_t> ParseUInt64(const std::string& str);

        static ParseResult Invalid(CommandType type, std::optional<std::string> callback);
    };

} // namespace wallet_link::engine
