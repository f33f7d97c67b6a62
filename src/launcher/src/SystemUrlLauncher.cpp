// src/launcher/src/SystemUrlLauncher.cpp
#include "launcher/include/SystemUrlLauncher.hpp"
#include "common/utils/logger/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wallet_link::launcher
{
    SystemUrlLauncher::SystemUrlLauncher(std::string command)
        : command_(std::move(command))
    {
        if (command_.empty()) {
            throw std::invalid_argument("SystemUrlLauncher: empty command");
        }
    }

    void SystemUrlLauncher::Open(const std::string& url)
    {
        LOG_INFOF("SystemUrlLauncher", "Launching: %s %s", command_.c_str(), url.c_str());

        pid_t pid = fork();
        if (pid < 0) {
            throw std::runtime_error(std::string("SystemUrlLauncher: fork failed: ") + std::strerror(errno));
        }

        if (pid == 0) {
            // 중간 프로세스: 손자 프로세스를 띄우고 바로 종료 → init이 회수
            pid_t grandchild = fork();
            if (grandchild == 0) {
                execlp(command_.c_str(), command_.c_str(), url.c_str(), static_cast<char*>(nullptr));
                _exit(127);
            }
            _exit(grandchild < 0 ? 1 : 0);
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw std::runtime_error(std::string("SystemUrlLauncher: waitpid failed: ") + std::strerror(errno));
            }
        }

        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            throw std::runtime_error("SystemUrlLauncher: failed to spawn " + command_);
        }
    }

} // namespace wallet_link::launcher
