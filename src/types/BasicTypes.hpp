// src/types/BasicTypes.hpp
#pragma once
#include <cstdint>
#include <vector>

namespace wallet_link
{
    using Bytes = std::vector<uint8_t>;

    // 명령 URL 쿼리 파라미터 이름
    namespace params
    {
        constexpr const char* CALLBACK = "callback";
        constexpr const char* MESSAGE = "message";
        constexpr const char* ADDRESS = "address";
        constexpr const char* GAS_PRICE = "gasPrice";
        constexpr const char* GAS_LIMIT = "gasLimit";
        constexpr const char* TO = "to";
        constexpr const char* AMOUNT = "amount";
        constexpr const char* NONCE = "nonce";
        constexpr const char* DATA = "data";

        // 콜백 URL에 덧붙이는 결과 파라미터
        constexpr const char* RESULT = "result";
        constexpr const char* ERROR = "error";
    }
}
