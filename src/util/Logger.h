#pragma once

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace util
{
    // 로그 레벨
    enum class LogLevel : int
    {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        LV_ERROR = 3
    };

    // 설정 문자열 -> 로그 레벨 ("debug", "info", "warn", "error")
    inline std::optional<LogLevel> parseLogLevel(std::string_view s) noexcept
    {
        if (s == "debug" || s == "DEBUG") return LogLevel::DEBUG;
        if (s == "info" || s == "INFO")   return LogLevel::INFO;
        if (s == "warn" || s == "WARN")   return LogLevel::WARN;
        if (s == "error" || s == "ERROR") return LogLevel::LV_ERROR;
        return std::nullopt;
    }

    /*
     * Logger - 백테스트 실행 로그
     *
     * 특징:
     * - 타임스탬프 + 레벨 + 컴포넌트 태그
     * - 로그 레벨 필터링
     * - 콘솔 + 파일 동시 출력
     *
     * 백테스트 시간(캔들 시각)과 로그 시각은 별개다.
     * 로그 시각은 실제 벽시계, 캔들 시각은 메시지 본문에 직접 넣는다.
     *
     * 사용 예시:
     *   Logger::instance().info("[SimExchange] order placed id=", id);
     *   Logger::instance().warn("[KlineStore] empty result for ", symbol);
     */
    class Logger final
    {
    public:
        // 싱글톤 인스턴스
        static Logger& instance()
        {
            static Logger logger;
            return logger;
        }

        // 로그 레벨 설정
        void setLevel(LogLevel level)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel level() const noexcept { return min_level_; }

        // 파일 출력 활성화 (실패 시 false, 콘솔 출력은 유지)
        bool enableFileOutput(const std::string& filename)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            file_stream_.open(filename, std::ios::app);
            if (!file_stream_.is_open())
            {
                std::cerr << "[Logger] Failed to open log file: " << filename << "\n";
                return false;
            }
            return true;
        }

        // 콘솔 출력 on/off (테스트에서 소음 제거용)
        void setConsoleOutput(bool enabled)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            console_enabled_ = enabled;
        }

        template <typename... Args>
        void debug(Args&&... args)
        {
            log(LogLevel::DEBUG, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void info(Args&&... args)
        {
            log(LogLevel::INFO, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(Args&&... args)
        {
            log(LogLevel::WARN, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(Args&&... args)
        {
            log(LogLevel::LV_ERROR, std::forward<Args>(args)...);
        }

    private:
        Logger() = default;

        static constexpr std::string_view levelToString(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::LV_ERROR: return "ERROR";
            }
            return "UNKNOWN";
        }

        static std::string getTimestamp()
        {
            auto now = std::chrono::system_clock::now();
            auto time_t_now = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            std::tm tm_buf{};
#ifdef _WIN32
            localtime_s(&tm_buf, &time_t_now);
#else
            localtime_r(&time_t_now, &tm_buf);
#endif

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
                << '.' << std::setfill('0') << std::setw(3) << ms.count();
            return oss.str();
        }

        template <typename... Args>
        void log(LogLevel level, Args&&... args)
        {
            if (level < min_level_)
                return;

            std::lock_guard<std::mutex> lock(mutex_);

            std::ostringstream oss;
            oss << "[" << getTimestamp() << "] "
                << "[" << levelToString(level) << "] ";
            (oss << ... << args);
            oss << "\n";

            const std::string message = oss.str();

            // 경고 이상은 stderr로 (백테스트 리포트 출력과 분리)
            if (console_enabled_)
            {
                if (level >= LogLevel::WARN)
                    std::cerr << message << std::flush;
                else
                    std::cout << message << std::flush;
            }

            if (file_stream_.is_open())
            {
                file_stream_ << message << std::flush;
            }
        }

    private:
        std::mutex mutex_;
        LogLevel min_level_{ LogLevel::INFO };
        bool console_enabled_{ true };
        std::ofstream file_stream_;
    };

    // 전역 로거 접근 헬퍼
    inline Logger& log() { return Logger::instance(); }

} // namespace util
