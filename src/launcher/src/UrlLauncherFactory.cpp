// src/launcher/src/UrlLauncherFactory.cpp
#include "launcher/include/UrlLauncherFactory.hpp"
#include "launcher/include/ConsoleUrlLauncher.hpp"
#include "launcher/include/SystemUrlLauncher.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace wallet_link::launcher
{
    std::shared_ptr<IUrlLauncher> UrlLauncherFactory::Create(
        const std::string& name,
        const std::string& command
    )
    {
        std::string normalized = NormalizeName(name);

        LOG_INFOF("UrlLauncherFactory", "Creating URL launcher: %s", normalized.c_str());

        if (normalized == "console")
        {
            return std::make_shared<ConsoleUrlLauncher>(std::cout);
        }
        else if (normalized == "system")
        {
            std::string program = command.empty() ? "xdg-open" : command;
            LOG_INFOF("UrlLauncherFactory", "System launcher command: %s", program.c_str());
            return std::make_shared<SystemUrlLauncher>(program);
        }

        std::string supported;
        for (const std::string& launcher : GetSupportedLaunchers()) {
            if (!supported.empty()) {
                supported += ", ";
            }
            supported += launcher;
        }
        LOG_ERRORF("UrlLauncherFactory", "Invalid URL launcher: %s (supported: %s)",
            name.c_str(), supported.c_str());

        throw std::invalid_argument("Invalid URL launcher: " + name);
    }

    std::vector<std::string> UrlLauncherFactory::GetSupportedLaunchers()
    {
        return {
            "console",
            "system"
        };
    }

    bool UrlLauncherFactory::IsValidLauncher(const std::string& name)
    {
        std::string normalized = NormalizeName(name);
        auto launchers = GetSupportedLaunchers();

        return std::find(launchers.begin(), launchers.end(), normalized) != launchers.end();
    }

    std::string UrlLauncherFactory::NormalizeName(const std::string& name)
    {
        std::string normalized = name;

        // 소문자로 변환
        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                      [](unsigned char c) { return std::tolower(c); });

        // 앞뒤 공백 제거
        size_t start = normalized.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return "";
        }

        size_t end = normalized.find_last_not_of(" \t\r\n");
        return normalized.substr(start, end - start + 1);
    }

} // namespace wallet_link::launcher
