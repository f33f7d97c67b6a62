// src/launcher/include/UrlLauncherFactory.hpp
#pragma once
#include "launcher/include/IUrlLauncher.hpp"
#include <memory>
#include <string>
#include <vector>

namespace wallet_link::launcher
{
    /**
     * @brief 설정값으로 URL 런처 구현체를 생성하는 Factory
     */
    class UrlLauncherFactory
    {
    public:
        /**
         * @brief 런처 인스턴스 생성
         *
         * @param name 런처 이름 ("console", "system"), 대소문자/앞뒤 공백 무시
         * @param command system 런처가 실행할 프로그램 (빈 값이면 xdg-open)
         * @return 런처 인스턴스 (console은 std::cout에 기록)
         * @throws std::invalid_argument 지원하지 않는 이름
         */
        static std::shared_ptr<IUrlLauncher> Create(
            const std::string& name,
            const std::string& command = ""
        );

        static std::vector<std::string> GetSupportedLaunchers();

        static bool IsValidLauncher(const std::string& name);

    private:
        UrlLauncherFactory() = delete;

        static std::string NormalizeName(const std::string& name);
    };

} // namespace wallet_link::launcher
