// src/host/main.cpp
#include "host/MockWalletSigner.hpp"
#include "engine/WalletLinkEngine.hpp"
#include "launcher/include/UrlLauncherFactory.hpp"
#include "common/env/EnvManager.hpp"
#include "common/utils/logger/Logger.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace wallet_link;
using namespace wallet_link::engine;
using namespace wallet_link::env;
using namespace wallet_link::host;
using namespace wallet_link::launcher;

namespace
{
    constexpr int EXIT_ALL_ACCEPTED = 0;
    constexpr int EXIT_CONFIG_ERROR = 1;
    constexpr int EXIT_NOT_ACCEPTED = 2;
}

void PrintUsage(const char* program_name)
{
    LOG_INFOF("WalletLinkHost", "Usage: %s [--env ENVIRONMENT] URL...", program_name);
    LOG_INFO("WalletLinkHost", "");
    LOG_INFO("WalletLinkHost", "Loads env/.env.ENVIRONMENT (default: local), handles every URL with a");
    LOG_INFO("WalletLinkHost", "mock signer and delivers callbacks through the configured launcher.");
    LOG_INFO("WalletLinkHost", "");
    LOG_INFO("WalletLinkHost", "Exit codes:");
    LOG_INFO("WalletLinkHost", "  0  every URL was accepted");
    LOG_INFO("WalletLinkHost", "  1  configuration or usage error");
    LOG_INFO("WalletLinkHost", "  2  at least one URL was not accepted");
}

int main(int argc, char* argv[])
{
    LOG_INFO("WalletLinkHost", "=== WalletLink Host ===");
    LOG_INFOF("WalletLinkHost", "Build: %s %s", __DATE__, __TIME__);

    // 명령행 인자 파싱
    std::string env_type = "local";
    std::vector<std::string> urls;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return EXIT_ALL_ACCEPTED;
        } else if (arg == "--env") {
            if (i + 1 >= argc) {
                LOG_ERROR("WalletLinkHost", "--env requires a value");
                PrintUsage(argv[0]);
                return EXIT_CONFIG_ERROR;
            }
            env_type = argv[++i];
        } else {
            urls.push_back(arg);
        }
    }

    if (urls.empty()) {
        LOG_ERROR("WalletLinkHost", "No URL given");
        PrintUsage(argv[0]);
        return EXIT_CONFIG_ERROR;
    }

    LOG_INFOF("WalletLinkHost", "Loading environment: %s", env_type.c_str());

    // 환경 설정 로드
    if (!EnvManager::Instance().Initialize(env_type)) {
        LOG_ERRORF("WalletLinkHost", "Failed to load environment: %s", env_type.c_str());
        return EXIT_CONFIG_ERROR;
    }

    try {
        // ========================================
        // 1. 설정 검증
        // ========================================
        std::vector<std::string> required_keys = {
            "URL_LAUNCHER",
            "MOCK_SIGNER_MODE"
        };

        LOG_INFO("WalletLinkHost", "Validating required configuration...");
        Config::ValidateRequired(required_keys);
        LOG_INFO("WalletLinkHost", "✓ All required configurations present");

        std::string log_file = Config::GetStringOr("LOG_FILE", "");
        if (!log_file.empty()) {
            utils::Logger::Instance().Initialize(log_file.c_str());
        }

        EnvManager::Instance().PrintLoadedConfig();

        std::string format_name = Config::GetStringOr("CALLBACK_ERROR_FORMAT", "symbolic");
        std::optional<ErrorCodeFormat> error_format = ErrorCodeFormatFromString(format_name);
        if (!error_format) {
            LOG_ERRORF("WalletLinkHost", "✗ Unsupported CALLBACK_ERROR_FORMAT: %s", format_name.c_str());
            return EXIT_CONFIG_ERROR;
        }

        std::string mode_name = Config::GetString("MOCK_SIGNER_MODE");
        std::optional<MockSignerMode> mode = MockSignerModeFromString(mode_name);
        if (!mode) {
            LOG_ERRORF("WalletLinkHost", "✗ Unsupported MOCK_SIGNER_MODE: %s", mode_name.c_str());
            return EXIT_CONFIG_ERROR;
        }

        uint32_t delay_ms = Config::GetUInt32Or("MOCK_SIGNER_DELAY_MS", 0);

        // ========================================
        // 2. 런처 / 서명자 / 엔진 구성
        // ========================================
        LOG_INFO("WalletLinkHost", "=== Engine Initialization ===");

        std::shared_ptr<IUrlLauncher> launcher = UrlLauncherFactory::Create(
            Config::GetString("URL_LAUNCHER"),
            Config::GetStringOr("URL_LAUNCHER_COMMAND", "")
        );

        asio::io_context io_context;
        auto signer = std::make_shared<MockWalletSigner>(io_context, *mode, std::chrono::milliseconds(delay_ms));

        EngineOptions options;
        options.error_format = *error_format;
        WalletLinkEngine engine(signer, launcher, options);

        LOG_INFOF("WalletLinkHost", "✓ Engine ready (launcher: %s, signer: %s)",
            launcher->GetName().c_str(), MockSignerModeToString(*mode));

        // ========================================
        // 3. URL 처리
        // ========================================
        size_t accepted = 0;
        for (const std::string& url : urls) {
            DispatchResult result = engine.Handle(url);
            if (result.accepted) {
                ++accepted;
                LOG_INFOF("WalletLinkHost", "  ✓ accepted: %s", url.c_str());
            } else {
                LOG_WARNF("WalletLinkHost", "  ✗ not handled: %s", url.c_str());
            }
        }

        // 서명 완료 전달 (모든 타이머가 끝나면 반환)
        io_context.run();

        LOG_INFOF("WalletLinkHost", "Accepted %zu/%zu URLs, %zu signing requests",
            accepted, urls.size(), signer->GetRequestCount());

        return accepted == urls.size() ? EXIT_ALL_ACCEPTED : EXIT_NOT_ACCEPTED;

    } catch (const ConfigMissingException& e) {
        LOG_ERRORF("WalletLinkHost", "✗ Configuration Error: %s", e.what());
        LOG_ERRORF("WalletLinkHost", "Please check your env/.env.%s file.", env_type.c_str());
        return EXIT_CONFIG_ERROR;
    } catch (const std::exception& e) {
        LOG_ERRORF("WalletLinkHost", "✗ Fatal Error: %s", e.what());
        return EXIT_CONFIG_ERROR;
    }
}
