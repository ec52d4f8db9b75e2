#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>

namespace solcore {
namespace common {

/**
 * @brief Logging levels for conditional debug output
 *
 * Core modules log rejected input at DEBUG so that malformed-buffer floods
 * cost nothing once the level is raised.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * @brief Structured log entry for JSON logging
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string thread_id;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/// Parse "trace", "DEBUG", ... (case-insensitive); nullopt when unrecognised
std::optional<LogLevel> parse_log_level(const std::string& name);

/// Upper-case name of a level ("INFO")
std::string log_level_name(LogLevel level);

/**
 * @brief Global logging configuration
 *
 * Level and format are atomics so every core call stays lock-free until a
 * line is actually written; output lines are serialized by a mutex.
 */
class Logger {
public:
    /// Get the singleton logger instance
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /// Set current logging level
    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Redirect output (tests capture into a stringstream); nullptr restores std::cerr
    void set_output(std::ostream* out) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        output_ = out ? out : &std::cerr;
    }

    /// Check if debug logging is enabled
    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    /// Check if a specific level is enabled
    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log with explicit module
    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            get_thread_id(),
            oss.str(),
            "",
            {}
        };

        output_log_entry(entry);
    }

    /// Log a structured message with context
    void log_structured(LogLevel level, const std::string& module,
                       const std::string& message, const std::string& error_code = "",
                       const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            get_thread_id(),
            message,
            error_code,
            context
        };

        output_log_entry(entry);
    }

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)),
               json_format_(false), output_(&std::cerr) {}

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;

    std::mutex output_mutex_;
    std::ostream* output_;

    void output_log_entry(const LogEntry& entry) {
        std::string line = json_format_.load() ? format_json(entry) : format_text(entry);
        std::lock_guard<std::mutex> lock(output_mutex_);
        *output_ << line << std::endl;
    }

    std::string get_thread_id() const;
    std::string escape_json_string(const std::string& input) const;
};

} // namespace common
} // namespace solcore

/**
 * @brief Performance-conscious logging macros
 *
 * These macros avoid string formatting overhead when logging is disabled.
 * The first argument is always the module name.
 */
#define LOG_TRACE(...) \
    do { \
        if (solcore::common::Logger::instance().is_enabled(solcore::common::LogLevel::TRACE)) { \
            solcore::common::Logger::instance().log(solcore::common::LogLevel::TRACE, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        if (solcore::common::Logger::instance().is_debug_enabled()) { \
            solcore::common::Logger::instance().log(solcore::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    solcore::common::Logger::instance().log(solcore::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    solcore::common::Logger::instance().log(solcore::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    solcore::common::Logger::instance().log(solcore::common::LogLevel::ERROR, __VA_ARGS__)

/**
 * @brief Structured logging macros for better observability
 */
#define LOG_STRUCTURED(level, module, message, ...) \
    solcore::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)

/// Rejected untrusted input: DEBUG with an error code, skipped entirely when disabled
#define LOG_REJECTION(module, message, ...) \
    do { \
        if (solcore::common::Logger::instance().is_debug_enabled()) { \
            LOG_STRUCTURED(solcore::common::LogLevel::DEBUG, module, message, ##__VA_ARGS__); \
        } \
    } while(0)
