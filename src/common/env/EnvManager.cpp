// src/common/env/EnvManager.cpp
#include "common/env/EnvManager.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>

namespace wallet_link::env
{
    // 정적 멤버 초기화
    std::unique_ptr<EnvManager> EnvManager::instance = nullptr;
    std::mutex EnvManager::instance_mutex;

    EnvManager& EnvManager::Instance()
    {
        std::lock_guard<std::mutex> lock(instance_mutex);

        if (!instance) {
            // private 생성자라 make_unique 사용 불가
            instance = std::unique_ptr<EnvManager>(new EnvManager());
        }

        return *instance;
    }

    bool EnvManager::Initialize(const std::string& env_type)
    {
        std::lock_guard<std::mutex> lock(config_mutex);

        if (is_initialized) {
            LOG_WARNF("EnvManager", "Already initialized. Current env: %s, Requested: %s",
                env_config->GetEnvType().c_str(), env_type.c_str());
            return env_config->GetEnvType() == env_type;
        }

        env_config = std::make_unique<EnvConfig>();

        if (!env_config->LoadFromEnv(env_type)) {
            LOG_ERRORF("EnvManager", "Failed to load environment configuration: %s", env_type.c_str());
            env_config.reset();
            return false;
        }

        is_initialized = true;
        LOG_INFOF("EnvManager", "✓ Initialized with environment: %s", env_type.c_str());
        return true;
    }

    bool EnvManager::IsInitialized() const
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        return is_initialized;
    }

    const EnvConfig& EnvManager::GetConfig() const
    {
        EnsureInitialized();
        return *env_config;
    }

    void EnvManager::EnsureInitialized() const
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        if (!is_initialized || !env_config) {
            throw std::runtime_error(
                "EnvManager not initialized. Call EnvManager::Instance().Initialize(env_type) first."
            );
        }
    }

    std::string EnvManager::GetString(const std::string& key) const
    {
        return GetConfig().GetString(key);
    }

    std::string EnvManager::GetStringOr(const std::string& key, const std::string& default_value) const
    {
        return GetConfig().GetStringOr(key, default_value);
    }

    uint32_t EnvManager::GetUInt32Or(const std::string& key, uint32_t default_value) const
    {
        return GetConfig().GetUInt32Or(key, default_value);
    }

    bool EnvManager::HasKey(const std::string& key) const
    {
        return GetConfig().HasKey(key);
    }

    std::string EnvManager::GetEnvType() const
    {
        return GetConfig().GetEnvType();
    }

    void EnvManager::ValidateRequired(const std::vector<std::string>& required_keys) const
    {
        GetConfig().ValidateRequired(required_keys);
    }

    void EnvManager::PrintLoadedConfig() const
    {
        if (!IsInitialized()) {
            LOG_INFO("EnvManager", "EnvManager not initialized");
            return;
        }

        LOG_INFO("EnvManager", "=== Current Configuration ===");
        LOG_INFOF("EnvManager", "Environment: %s", GetEnvType().c_str());

        const char* keys[] = {
            "LOG_FILE",
            "URL_LAUNCHER", "URL_LAUNCHER_COMMAND",
            "CALLBACK_ERROR_FORMAT",
            "MOCK_SIGNER_MODE", "MOCK_SIGNER_DELAY_MS"
        };

        for (const char* key : keys) {
            if (HasKey(key)) {
                LOG_INFOF("EnvManager", "  %s: %s", key, GetConfig().GetStringOr(key, "").c_str());
            }
        }
        LOG_INFO("EnvManager", "=============================");
    }

} // namespace wallet_link::env
