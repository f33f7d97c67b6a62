// src/launcher/include/IUrlLauncher.hpp
#pragma once
#include <string>

namespace wallet_link::launcher
{
    /**
     * @brief 콜백 URL을 대상 앱으로 전달하는 인터페이스
     *
     * fire-and-forget: 전달 확인 없음. 구현체는 실패 시 예외를 던질 수 있으며
     * 호출자(ResultEncoder)가 로그로 처리합니다.
     */
    class IUrlLauncher
    {
    public:
        virtual ~IUrlLauncher() = default;

        virtual void Open(const std::string& url) = 0;

        /**
         * @brief 런처 이름 (예: "console", "system")
         */
        virtual std::string GetName() const = 0;
    };

} // namespace wallet_link::launcher
