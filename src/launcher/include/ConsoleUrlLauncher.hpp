// src/launcher/include/ConsoleUrlLauncher.hpp
#pragma once
#include "launcher/include/IUrlLauncher.hpp"
#include <mutex>
#include <ostream>

namespace wallet_link::launcher
{
    /**
     * @brief URL을 한 줄씩 출력 스트림에 기록하는 런처
     *
     * 호스트 앱 없이 실행할 때 사용. 스트림은 런처보다 오래 살아 있어야 함.
     */
    class ConsoleUrlLauncher : public IUrlLauncher
    {
    public:
        explicit ConsoleUrlLauncher(std::ostream& out);

        void Open(const std::string& url) override;
        std::string GetName() const override { return "console"; }

    private:
        std::ostream& out_;
        std::mutex out_mutex_;
    };

} // namespace wallet_link::launcher
