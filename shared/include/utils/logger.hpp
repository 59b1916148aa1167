#pragma once

#include <string>
#include <memory>
#include <chrono>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace pmx {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

LogLevel parse_log_level(const std::string& level, LogLevel fallback = LogLevel::INFO);
std::string to_string(LogLevel level);

class Logger {
public:
    static void initialize(const std::string& log_file_path = "logs/pmx.log",
                          LogLevel level = LogLevel::INFO,
                          size_t max_file_size = 1024 * 1024 * 10,  // 10MB
                          size_t max_files = 3,
                          bool console_output = true);

    static void shutdown();

    // Template logging functions
    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->critical(fmt, std::forward<Args>(args)...);
        }
    }

    // Convenience methods for single string logging
    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void critical(const std::string& msg);

    // Set log level dynamically
    static void set_level(LogLevel level);

    // Get current log level
    static LogLevel get_level();

    // Check if a log level is enabled
    static bool is_enabled(LogLevel level);

    static bool is_initialized();

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static LogLevel current_level_;

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
};

// Structured logging for analytics events
class AnalyticsLogger {
public:
    static void log_signal_detected(const std::string& signal_type, const std::string& primary_market,
                                   const std::string& related_market, double score, double confidence);

    static void log_consistency_finding(const std::string& severity, const std::string& title,
                                       const std::string& detail);

    static void log_strategy_built(const std::string& primary_market, const std::string& view,
                                  size_t leg_count, double capped_shares, double capital_at_risk);

    static void log_execution_shortfall(const std::string& market, const std::string& outcome,
                                       double requested, double filled);

    static void log_batch_item_failed(const std::string& operation, const std::string& item_id,
                                     const std::string& error_kind, const std::string& message);

    static void log_performance_metric(const std::string& metric_name, double value);
};

// RAII logging scope for performance measurement
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

private:
    std::string operation_name_;
    std::chrono::high_resolution_clock::time_point start_time_;
};

// Macros for convenient logging
#define PMX_LOG_TRACE(...) pmx::utils::Logger::trace(__VA_ARGS__)
#define PMX_LOG_DEBUG(...) pmx::utils::Logger::debug(__VA_ARGS__)
#define PMX_LOG_INFO(...) pmx::utils::Logger::info(__VA_ARGS__)
#define PMX_LOG_WARN(...) pmx::utils::Logger::warn(__VA_ARGS__)
#define PMX_LOG_ERROR(...) pmx::utils::Logger::error(__VA_ARGS__)
#define PMX_LOG_CRITICAL(...) pmx::utils::Logger::critical(__VA_ARGS__)

#define PMX_SCOPED_TIMER(name) pmx::utils::ScopedTimer timer(name)

} // namespace utils
} // namespace pmx
