// src/launcher/src/ConsoleUrlLauncher.cpp
#include "launcher/include/ConsoleUrlLauncher.hpp"
#include "common/utils/logger/Logger.hpp"

namespace wallet_link::launcher
{
    ConsoleUrlLauncher::ConsoleUrlLauncher(std::ostream& out)
        : out_(out)
    {
    }

    void ConsoleUrlLauncher::Open(const std::string& url)
    {
        LOG_INFOF("ConsoleUrlLauncher", "Open: %s", url.c_str());

        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << url << std::endl;
    }

} // namespace wallet_link::launcher
