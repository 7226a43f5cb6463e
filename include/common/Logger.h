#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace regimepairs {

// 초기화 전에는 모든 로그 호출이 무시됨 (테스트/라이브러리 사용 시)
class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // One CSV line per closed pairs trade in trades.log
    void logTrade(const std::string& trade_id, const std::string& strategy,
                  const std::string& direction, int entry_day, int exit_day,
                  double pnl, const std::string& exit_reason);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) regimepairs::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) regimepairs::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) regimepairs::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) regimepairs::Logger::getInstance().error(__VA_ARGS__)

} // namespace regimepairs
