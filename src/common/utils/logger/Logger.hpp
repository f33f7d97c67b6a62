// src/common/utils/logger/Logger.hpp
#pragma once

#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <memory>
#include <string>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#ifndef COMPILE_LOG_LEVEL
    #ifdef NDEBUG
        #define COMPILE_LOG_LEVEL 1  // Release: INFO 이상
    #else
        #define COMPILE_LOG_LEVEL 0  // Debug: 모든 로그
    #endif
#endif

namespace wallet_link::utils {

enum class LogLevel : int {
    DEBUG = 0,  // 개발 디버깅
    INFO = 1,   // 명령 수신/처리 결과
    WARN = 2,   // 무시된 명령, 잘못된 콜백
    ERROR = 3,  // 서명자/런처 오류
    FATAL = 4,  // 호스트 기동 실패
    NONE = 5    // 로그 비활성화
};

class Logger {
private:
    inline static std::unique_ptr<Logger> instance = nullptr;
    inline static std::mutex instance_mutex;

    LogLevel min_level = static_cast<LogLevel>(COMPILE_LOG_LEVEL);
    std::mutex log_mutex;
    std::ofstream file;
    bool console_enabled = true;
    bool file_enabled = false;

    Logger() = default;

    static const char* LogLevelToString(LogLevel level) {
        switch(level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKN ";
        }
    }

    static LogLevel StringToLogLevel(const char* str) {
        if (!str) return LogLevel::INFO;

        std::string level_str(str);
        if (level_str == "DEBUG" || level_str == "0") return LogLevel::DEBUG;
        if (level_str == "INFO"  || level_str == "1") return LogLevel::INFO;
        if (level_str == "WARN"  || level_str == "2") return LogLevel::WARN;
        if (level_str == "ERROR" || level_str == "3") return LogLevel::ERROR;
        if (level_str == "FATAL" || level_str == "4") return LogLevel::FATAL;
        if (level_str == "NONE"  || level_str == "5") return LogLevel::NONE;

        return LogLevel::INFO;
    }

    static std::string GetTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

public:
    static Logger& Instance() {
        std::lock_guard<std::mutex> lock(instance_mutex);
        if (!instance) {
            instance.reset(new Logger());
        }
        return *instance;
    }

    /**
     * @brief 로거 초기화
     *
     * 런타임 레벨은 WALLET_LINK_LOG_LEVEL, 없으면 LOG_LEVEL 환경변수에서 읽습니다.
     * COMPILE_LOG_LEVEL보다 낮은 레벨은 요청해도 적용되지 않습니다.
     *
     * @param log_file 로그 파일 경로 (nullptr 또는 빈 문자열이면 콘솔만)
     * @param enable_console 콘솔 출력 여부
     */
    void Initialize(const char* log_file = nullptr, bool enable_console = true) {
        std::lock_guard<std::mutex> lock(log_mutex);
        console_enabled = enable_console;

        if (file.is_open()) {
            file.close();
        }
        file_enabled = false;

        if (log_file && *log_file) {
            file.open(log_file, std::ios::app);
            file_enabled = file.is_open();
        }

        const char* runtime_level = std::getenv("WALLET_LINK_LOG_LEVEL");
        if (!runtime_level) {
            runtime_level = std::getenv("LOG_LEVEL");
        }

        LogLevel requested_level = runtime_level
            ? StringToLogLevel(runtime_level)
            : static_cast<LogLevel>(COMPILE_LOG_LEVEL);

        if (static_cast<int>(requested_level) < COMPILE_LOG_LEVEL) {
            std::cerr << "[Logger] Warning: runtime level " << static_cast<int>(requested_level)
                      << " below COMPILE_LOG_LEVEL " << COMPILE_LOG_LEVEL
                      << ", using COMPILE_LOG_LEVEL" << std::endl;
            requested_level = static_cast<LogLevel>(COMPILE_LOG_LEVEL);
        }
        min_level = requested_level;

        if (console_enabled) {
            std::cout << "[Logger] Initialized (level " << LogLevelToString(min_level) << ")";
            if (file_enabled) {
                std::cout << ", file: " << log_file;
            }
            std::cout << std::endl;
        }
    }

    // 테스트에서 출력 억제용
    void SetMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(log_mutex);
        min_level = level;
    }

    void SetConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(log_mutex);
        console_enabled = enabled;
    }

    void Log(LogLevel level, const char* category, const char* message) {
        std::lock_guard<std::mutex> lock(log_mutex);
        if (static_cast<int>(level) < static_cast<int>(min_level)) return;

        std::string log_line = GetTimestamp() + " [" + LogLevelToString(level) + "] " +
                               "[" + category + "] " + message + "\n";

        if (console_enabled) {
            if (level >= LogLevel::ERROR) {
                std::cerr << log_line;
            } else {
                std::cout << log_line;
            }
        }

        if (file_enabled && file.is_open()) {
            file << log_line;
            if (level >= LogLevel::ERROR) {
                file.flush();
            }
        }
    }

    void Logf(LogLevel level, const char* category, const char* format, ...) {
        char buffer[4096];
        va_list args;
        va_start(args, format);
        std::vsnprintf(buffer, sizeof(buffer), format, args);
        va_end(args);

        Log(level, category, buffer);
    }

    ~Logger() {
        if (file.is_open()) {
            file.close();
        }
    }
};

} // namespace wallet_link::utils

// ========================================
// 컴파일 타임 로그 제거 매크로
// ========================================

#define LOG_IMPL(level, cat, msg) \
    wallet_link::utils::Logger::Instance().Log(wallet_link::utils::LogLevel::level, cat, msg)

#define LOG_IMPLF(level, cat, fmt, ...) \
    wallet_link::utils::Logger::Instance().Logf(wallet_link::utils::LogLevel::level, cat, fmt, ##__VA_ARGS__)

// DEBUG (COMPILE_LOG_LEVEL <= 0)
#if COMPILE_LOG_LEVEL <= 0
    #define LOG_DEBUG(cat, msg) LOG_IMPL(DEBUG, cat, msg)
    #define LOG_DEBUGF(cat, fmt, ...) LOG_IMPLF(DEBUG, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_DEBUG(cat, msg) ((void)0)
    #define LOG_DEBUGF(cat, fmt, ...) ((void)0)
#endif

// INFO (COMPILE_LOG_LEVEL <= 1)
#if COMPILE_LOG_LEVEL <= 1
    #define LOG_INFO(cat, msg) LOG_IMPL(INFO, cat, msg)
    #define LOG_INFOF(cat, fmt, ...) LOG_IMPLF(INFO, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_INFO(cat, msg) ((void)0)
    #define LOG_INFOF(cat, fmt, ...) ((void)0)
#endif

// WARN (COMPILE_LOG_LEVEL <= 2)
#if COMPILE_LOG_LEVEL <= 2
    #define LOG_WARN(cat, msg) LOG_IMPL(WARN, cat, msg)
    #define LOG_WARNF(cat, fmt, ...) LOG_IMPLF(WARN, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_WARN(cat, msg) ((void)0)
    #define LOG_WARNF(cat, fmt, ...) ((void)0)
#endif

// ERROR (COMPILE_LOG_LEVEL <= 3)
#if COMPILE_LOG_LEVEL <= 3
    #define LOG_ERROR(cat, msg) LOG_IMPL(ERROR, cat, msg)
    #define LOG_ERRORF(cat, fmt, ...) LOG_IMPLF(ERROR, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_ERROR(cat, msg) ((void)0)
    #define LOG_ERRORF(cat, fmt, ...) ((void)0)
#endif

// FATAL (COMPILE_LOG_LEVEL <= 4)
#if COMPILE_LOG_LEVEL <= 4
    #define LOG_FATAL(cat, msg) LOG_IMPL(FATAL, cat, msg)
    #define LOG_FATALF(cat, fmt, ...) LOG_IMPLF(FATAL, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_FATAL(cat, msg) ((void)0)
    #define LOG_FATALF(cat, fmt, ...) ((void)0)
#endif
