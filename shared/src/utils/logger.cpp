#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace pmx {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
LogLevel Logger::current_level_ = LogLevel::INFO;

LogLevel parse_log_level(const std::string& level, LogLevel fallback) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return fallback;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "INFO";
    }
}

void Logger::initialize(const std::string& log_file_path, LogLevel level,
                       size_t max_file_size, size_t max_files, bool console_output) {
    try {
        if (logger_) {
            shutdown();
        }

        // Create logs directory if it doesn't exist
        std::filesystem::path log_path(log_file_path);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;

        if (console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(level));
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(console_sink);
        }

        // Create rotating file sink
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file_path, max_file_size, max_files);
        file_sink->set_level(to_spdlog_level(level));
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);

        logger_ = std::make_shared<spdlog::logger>("pmx", sinks.begin(), sinks.end());

        // Set log level
        logger_->set_level(to_spdlog_level(level));
        current_level_ = level;

        // Set flush policy
        logger_->flush_on(spdlog::level::warn);

        Logger::info("Logger initialized with level {}", to_string(level));

    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        logger_ = nullptr;
    }
}

void Logger::trace(const std::string& msg) {
    if (logger_) logger_->trace(msg);
}

void Logger::debug(const std::string& msg) {
    if (logger_) logger_->debug(msg);
}

void Logger::info(const std::string& msg) {
    if (logger_) logger_->info(msg);
}

void Logger::warn(const std::string& msg) {
    if (logger_) logger_->warn(msg);
}

void Logger::error(const std::string& msg) {
    if (logger_) logger_->error(msg);
}

void Logger::critical(const std::string& msg) {
    if (logger_) logger_->critical(msg);
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
        for (auto& sink : logger_->sinks()) {
            sink->set_level(to_spdlog_level(level));
        }
    }
}

LogLevel Logger::get_level() {
    return current_level_;
}

bool Logger::is_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(current_level_);
}

bool Logger::is_initialized() {
    return logger_ != nullptr;
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default: return spdlog::level::info;
    }
}

// AnalyticsLogger implementation
void AnalyticsLogger::log_signal_detected(const std::string& signal_type, const std::string& primary_market,
                                         const std::string& related_market, double score, double confidence) {
    std::stringstream ss;
    ss << "SIGNAL_DETECTED | Type: " << signal_type << " | Primary: " << primary_market;
    if (!related_market.empty()) {
        ss << " | Related: " << related_market;
    }
    ss << " | Score: " << std::fixed << std::setprecision(4) << score
       << " | Confidence: " << std::setprecision(2) << confidence;
    Logger::debug(ss.str());
}

void AnalyticsLogger::log_consistency_finding(const std::string& severity, const std::string& title,
                                             const std::string& detail) {
    std::stringstream ss;
    ss << "CONSISTENCY_FINDING | Severity: " << severity << " | Title: " << title
       << " | Detail: " << detail;
    Logger::debug(ss.str());
}

void AnalyticsLogger::log_strategy_built(const std::string& primary_market, const std::string& view,
                                        size_t leg_count, double capped_shares, double capital_at_risk) {
    std::stringstream ss;
    ss << "STRATEGY_BUILT | Primary: " << primary_market << " | View: " << view
       << " | Legs: " << leg_count << " | CappedShares: " << capped_shares
       << " | CapitalAtRisk: " << std::fixed << std::setprecision(2) << capital_at_risk;
    Logger::info(ss.str());
}

void AnalyticsLogger::log_execution_shortfall(const std::string& market, const std::string& outcome,
                                             double requested, double filled) {
    std::stringstream ss;
    ss << "EXECUTION_SHORTFALL | Market: " << market << " | Outcome: " << outcome
       << " | Requested: " << requested << " | Filled: " << filled
       << " | Shortfall: " << (requested - filled);
    Logger::warn(ss.str());
}

void AnalyticsLogger::log_batch_item_failed(const std::string& operation, const std::string& item_id,
                                           const std::string& error_kind, const std::string& message) {
    std::stringstream ss;
    ss << "BATCH_ITEM_FAILED | Operation: " << operation << " | Item: " << item_id
       << " | Kind: " << error_kind << " | Message: " << message;
    Logger::warn(ss.str());
}

void AnalyticsLogger::log_performance_metric(const std::string& metric_name, double value) {
    std::stringstream ss;
    ss << "PERFORMANCE_METRIC | Metric: " << metric_name << " | Value: " << value;
    Logger::debug(ss.str());
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::high_resolution_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time_);
    std::stringstream ss;
    ss << "TIMER | Operation: " << operation_name_ << " | Duration: " << duration.count() << " us";
    Logger::debug(ss.str());
}

} // namespace utils
} // namespace pmx
