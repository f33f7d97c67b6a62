// src/common/utils/encoding/Base64.hpp
#pragma once
#include "types/BasicTypes.hpp"
#include <optional>
#include <string>

namespace wallet_link::utils
{
    /**
     * @brief 표준 base64 인코딩 (패딩 포함, 줄바꿈 없음)
     */
    std::string Base64Encode(const Bytes& data);

    /**
     * @brief 엄격한 base64 디코딩
     *
     * - 길이는 4의 배수여야 함 (패딩 필수)
     * - 공백 및 알파벳 외 문자 거부
     * - '='는 마지막 1~2자리에만 허용
     * - 빈 문자열은 빈 바이트열로 디코딩
     *
     * @return 실패 시 std::nullopt
     */
    std::optional<Bytes> Base64Decode(const std::string& encoded);

} // namespace wallet_link::utils
