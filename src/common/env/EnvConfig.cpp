// src/common/env/EnvConfig.cpp
#include "common/env/EnvConfig.hpp"
#include "common/utils/logger/Logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace wallet_link::env
{
    bool EnvConfig::LoadFromFile(const std::string& file_path)
    {
        std::ifstream file(file_path);
        if (!file.is_open())
        {
            LOG_ERRORF("EnvConfig", "Failed to open config file: %s", file_path.c_str());
            return false;
        }
        config_map.clear();

        std::string line;
        size_t line_no = 0;
        while (std::getline(file, line))
        {
            ++line_no;
            if (!ParseLine(line)) {
                LOG_WARNF("EnvConfig", "%s:%zu: ignoring malformed line", file_path.c_str(), line_no);
            }
        }
        file.close();

        is_loaded = true;
        LOG_INFOF("EnvConfig", "Loaded %zu configuration entries from %s", config_map.size(), file_path.c_str());
        return true;
    }

    bool EnvConfig::LoadFromEnv(const std::string& env_name)
    {
        env_type = env_name;
        std::string file_path = "env/.env." + env_name;
        return LoadFromFile(file_path);
    }

    std::string EnvConfig::GetString(const std::string& key) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            throw ConfigMissingException(key);
        }
        return it->second;
    }

    std::string EnvConfig::GetStringOr(const std::string& key, const std::string& default_value) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            return default_value;
        }
        return it->second;
    }

    uint32_t EnvConfig::GetUInt32Or(const std::string& key, uint32_t default_value) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            return default_value;
        }

        const std::string& value = it->second;

        // stoul은 '-'를 받아들이므로 숫자만 허용
        if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw std::runtime_error("Invalid uint32 value for key '" + key + "': " + value);
        }

        try {
            unsigned long parsed = std::stoul(value);
            if (parsed > UINT32_MAX) {
                throw std::out_of_range("Value too large for uint32_t");
            }
            return static_cast<uint32_t>(parsed);
        } catch (const std::exception& e) {
            throw std::runtime_error("Invalid uint32 value for key '" + key + "': " + value);
        }
    }

    bool EnvConfig::HasKey(const std::string& key) const
    {
        return config_map.find(key) != config_map.end();
    }

    void EnvConfig::ValidateRequired(const std::vector<std::string>& required_keys) const
    {
        std::vector<std::string> missing_keys;

        for (const std::string& key : required_keys) {
            if (!HasKey(key) || config_map.at(key).empty()) {
                missing_keys.push_back(key);
            }
        }

        if (!missing_keys.empty()) {
            std::stringstream ss;
            ss << "Missing required configuration keys: ";
            for (size_t i = 0; i < missing_keys.size(); ++i) {
                ss << missing_keys[i];
                if (i < missing_keys.size() - 1) {
                    ss << ", ";
                }
            }
            throw std::runtime_error(ss.str());
        }
    }

    bool EnvConfig::ParseLine(const std::string& line)
    {
        // 앞뒤 공백 제거
        std::string trimmed = line;
        trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
        trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);

        // 빈 줄이나 주석은 무시
        if (trimmed.empty() || trimmed[0] == '#')
        {
            return true;
        }

        size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos)
        {
            return false;
        }

        std::string key = trimmed.substr(0, eq_pos);
        std::string value = trimmed.substr(eq_pos + 1);

        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));

        if (!key.empty())
        {
            config_map[key] = value;
            return true;
        }

        return false;
    }
} // namespace wallet_link::env
