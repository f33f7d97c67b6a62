// src/types/WalletError.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace wallet_link
{
    /**
     * @brief 요청 처리 및 서명 실패 분류
     *
     * NONE은 "에러 없음"을 나타내는 자리표시 값이며 콜백으로 직렬화되지 않습니다.
     * 숫자 코드는 외부 호출 앱과의 호환을 위해 고정입니다.
     */
    enum class WalletError : int32_t
    {
        NONE = -1,
        UNKNOWN = 0,
        INVALID_REQUEST = 1,        // 필수 필드 누락 또는 디코딩 실패
        WATCH_ONLY = 2,             // 서명 불가능한 watch-only 계정
        CANCELLED = 3,              // 사용자가 거절
        UNSUPPORTED_ADDRESS = 4,    // 서명자가 지원하지 않는 주소
        SIGNING_FAILED = 5          // 서명자 내부 오류
    };

    /**
     * @brief 콜백에 사용되는 심볼 식별자 (예: "invalidRequest")
     */
    const char* WalletErrorToString(WalletError error);

    /**
     * @brief 심볼 식별자 또는 숫자 코드를 WalletError로 변환
     * @return 알 수 없는 값이면 std::nullopt
     */
    std::optional<WalletError> WalletErrorFromString(const std::string& str);

    inline int32_t WalletErrorToCode(WalletError error)
    {
        return static_cast<int32_t>(error);
    }

} // namespace wallet_link
