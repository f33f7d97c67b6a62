// src/common/utils/encoding/Hex.hpp
#pragma once
#include "types/BasicTypes.hpp"
#include <optional>
#include <string>

namespace wallet_link::utils
{
    // 소문자, 접두사 없음
    std::string HexEncode(const Bytes& data);

    /**
     * @brief hex 문자열 디코딩
     *
     * "0x"/"0X" 접두사는 선택. 길이가 홀수이거나 hex가 아닌 문자가 있으면 실패.
     * "0x" 또는 빈 문자열은 빈 바이트열.
     */
    std::optional<Bytes> HexDecode(const std::string& hex);

} // namespace wallet_link::utils
