#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace rtvoice {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging with optional file output. Safe to call from the
 * audio task, the network read thread and tool workers concurrently.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    static LogLevel get_level();

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive); INFO otherwise
     */
    static LogLevel parse_level(const std::string& name);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) rtvoice::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) rtvoice::Logger::info(msg)
#define LOG_WARN(msg) rtvoice::Logger::warn(msg)
#define LOG_ERROR(msg) rtvoice::Logger::error(msg)

// Component-specific logging macros
#define LOG_AUDIO(msg) rtvoice::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_RT(msg) rtvoice::Logger::info(std::string("[Realtime] ") + (msg))
#define LOG_TOOL(msg) rtvoice::Logger::info(std::string("[Tool] ") + (msg))
#define LOG_SESSION(msg) rtvoice::Logger::info(std::string("[Session] ") + (msg))
#define LOG_BROKER(msg) rtvoice::Logger::info(std::string("[Broker] ") + (msg))

} // namespace rtvoice
