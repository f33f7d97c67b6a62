// src/common/env/EnvManager.hpp
#pragma once
#include "common/env/EnvConfig.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace wallet_link::env
{
    /**
     * @brief 글로벌 설정 관리자 (싱글톤)
     *
     * 호스트 프로세스 전체에서 하나의 설정 인스턴스를 공유합니다.
     */
    class EnvManager
    {
    private:
        static std::unique_ptr<EnvManager> instance;
        static std::mutex instance_mutex;

        std::unique_ptr<EnvConfig> env_config;
        mutable std::mutex config_mutex;

        bool is_initialized = false;

        // 생성자를 private으로 하여 외부 생성 방지
        EnvManager() = default;

    public:
        ~EnvManager() = default;

        // 복사/이동 방지
        EnvManager(const EnvManager&) = delete;
        EnvManager& operator=(const EnvManager&) = delete;
        EnvManager(EnvManager&&) = delete;
        EnvManager& operator=(EnvManager&&) = delete;

        /**
         * @brief 싱글톤 인스턴스 획득
         */
        static EnvManager& Instance();

        /**
         * @brief 환경 설정 초기화
         * @param env_type 환경 이름 (env/.env.<env_type> 로드)
         * @return 초기화 성공 여부
         */
        bool Initialize(const std::string& env_type);

        bool IsInitialized() const;

        /**
         * @brief 환경 설정 객체 접근
         * @return EnvConfig 참조 (초기화되지 않았으면 예외 발생)
         */
        const EnvConfig& GetConfig() const;

        std::string GetString(const std::string& key) const;
        std::string GetStringOr(const std::string& key, const std::string& default_value) const;
        uint32_t GetUInt32Or(const std::string& key, uint32_t default_value) const;
        bool HasKey(const std::string& key) const;
        std::string GetEnvType() const;

        void ValidateRequired(const std::vector<std::string>& required_keys) const;

        /**
         * @brief 현재 로드된 설정 정보 출력 (디버깅용)
         */
        void PrintLoadedConfig() const;

    private:
        void EnsureInitialized() const;
    };

    /**
     * @brief 전역 설정 접근을 위한 편의 함수들
     *
     * EnvManager::Instance().GetString(key) 대신
     * Config::GetString(key)로 간단하게 사용 가능
     */
    namespace Config
    {
        inline const EnvConfig& Get() {
            return EnvManager::Instance().GetConfig();
        }

        inline std::string GetString(const std::string& key) {
            return EnvManager::Instance().GetString(key);
        }

        inline std::string GetStringOr(const std::string& key, const std::string& default_value) {
            return EnvManager::Instance().GetStringOr(key, default_value);
        }

        inline uint32_t GetUInt32Or(const std::string& key, uint32_t default_value) {
            return EnvManager::Instance().GetUInt32Or(key, default_value);
        }

        inline bool HasKey(const std::string& key) {
            return EnvManager::Instance().HasKey(key);
        }

        inline std::string GetEnvType() {
            return EnvManager::Instance().GetEnvType();
        }

        inline void ValidateRequired(const std::vector<std::string>& required_keys) {
            EnvManager::Instance().ValidateRequired(required_keys);
        }

        inline bool IsInitialized() {
            return EnvManager::Instance().IsInitialized();
        }
    }

} // namespace wallet_link::env
