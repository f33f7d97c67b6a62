// src/common/env/EnvConfig.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace wallet_link::env
{
    // 설정 누락 예외
    class ConfigMissingException : public std::runtime_error {
    public:
        explicit ConfigMissingException(const std::string& key)
            : std::runtime_error("Required config missing: " + key) {}
    };

    /**
     * @brief KEY=VALUE 형식의 env 파일 (env/.env.<name>)
     *
     * '#'로 시작하는 줄과 빈 줄은 무시, 키/값 앞뒤 공백 제거.
     */
    class EnvConfig
    {
    private:
        std::unordered_map<std::string, std::string> config_map;
        std::string env_type;
        bool is_loaded = false;

    public:
        EnvConfig() = default;
        ~EnvConfig() = default;

        // 환경 설정 파일 로드
        bool LoadFromFile(const std::string& file_path);
        bool LoadFromEnv(const std::string& env_name);  // env/.env.{env_name}

        // 필수 값 (없거나 비어 있으면 ConfigMissingException)
        std::string GetString(const std::string& key) const;

        // 선택 값 (없거나 비어 있으면 기본값, 형식이 틀리면 예외)
        std::string GetStringOr(const std::string& key, const std::string& default_value) const;
        uint32_t GetUInt32Or(const std::string& key, uint32_t default_value) const;

        // 설정값 존재 여부 확인
        bool HasKey(const std::string& key) const;

        // 환경 정보
        std::string GetEnvType() const { return env_type; }
        bool IsLoaded() const { return is_loaded; }
        size_t Size() const { return config_map.size(); }

        // 여러 필수 키 한번에 검증
        void ValidateRequired(const std::vector<std::string>& required_keys) const;

    private:
        bool ParseLine(const std::string& line);
    };
} // namespace wallet_link::env
