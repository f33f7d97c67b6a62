// src/launcher/include/SystemUrlLauncher.hpp
#pragma once
#include "launcher/include/IUrlLauncher.hpp"
#include <string>

namespace wallet_link::launcher
{
    /**
     * @brief 외부 오프너 프로그램(xdg-open 등)으로 URL을 여는 런처
     *
     * double fork로 분리 실행하므로 오프너 종료를 기다리지 않고 좀비도 남기지 않음.
     * fork 실패 시 std::runtime_error.
     */
    class SystemUrlLauncher : public IUrlLauncher
    {
    public:
        explicit SystemUrlLauncher(std::string command = "xdg-open");

        void Open(const std::string& url) override;
        std::string GetName() const override { return "system"; }

        const std::string& GetCommand() const { return command_; }

    private:
        std::string command_;
    };

} // namespace wallet_link::launcher
