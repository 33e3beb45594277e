#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace voxlink {

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
 * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
 * @return Parsed level, or fallback if the name is not recognized
 */
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides structured logging with levels and optional file output.
 * Thread-safe for concurrent use from the WebSocket connection threads,
 * pipeline threads and audio workers.
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

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
    static const char* level_string(LogLevel level);
};

// Convenience macros for component-specific logging
#define LOG_DEBUG(msg) voxlink::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) voxlink::Logger::info(msg)
#define LOG_WARN(msg) voxlink::Logger::warn(msg)
#define LOG_ERROR(msg) voxlink::Logger::error(msg)

// Component-specific logging macros
#define LOG_AUDIO(msg) voxlink::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_STT(msg) voxlink::Logger::info(std::string("[STT] ") + (msg))
#define LOG_LLM(msg) voxlink::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_TTS(msg) voxlink::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_WS(msg) voxlink::Logger::info(std::string("[WS] ") + (msg))
#define LOG_SESSION(msg) voxlink::Logger::info(std::string("[Session] ") + (msg))
#define LOG_PIPELINE(msg) voxlink::Logger::info(std::string("[Pipeline] ") + (msg))
#define LOG_TOOL(msg) voxlink::Logger::info(std::string("[Tool] ") + (msg))
#define LOG_MEMORY(msg) voxlink::Logger::info(std::string("[Memory] ") + (msg))
#define LOG_TRACE(session_id, generation, stage, data) voxlink::Logger::debug(std::string("[trace] session=") + std::to_string(session_id) + " gen=" + std::to_string(generation) + " stage=" + (stage) + " " + (data))

} // namespace voxlink
