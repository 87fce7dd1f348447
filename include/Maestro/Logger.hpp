// =================================================================
// include/Maestro/Logger.hpp
// =================================================================
// Header for levelled logging of orchestration events.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>
#include <cstdint>

namespace Maestro {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger with console and rotating file output
 *
 * All public methods are safe to call from the degradation monitor thread
 * and from request threads at the same time.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".maestro/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable file logging
     * @param enabled True to write log files
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log a reservation attempt against the resource pool
     * @param reservation_id Reservation identifier (empty when the attempt failed)
     * @param memory_mb Granted or requested memory in MB
     * @param cpu Granted or requested CPU fraction
     * @param tokens Granted or requested tokens per second
     * @param success Whether the reservation was made
     */
    void logAllocation(const std::string& reservation_id, double memory_mb,
                       double cpu, double tokens, bool success);

    /**
     * @brief Log a degradation level transition
     * @param from Previous level name
     * @param to New level name
     * @param memory_percent Sampled used-memory percentage
     */
    void logDegradationChange(const std::string& from, const std::string& to,
                              double memory_percent);

    /**
     * @brief Log a model load, unload or handoff
     * @param action Transition name ("load", "unload", "handoff")
     * @param model_id Model identifier
     * @param memory_bytes Memory accounted to the model
     */
    void logModelTransition(const std::string& action, const std::string& model_id,
                            uint64_t memory_bytes);

    /**
     * @brief Log the outcome of a task execution
     * @param task_id Task identifier
     * @param model_id Model that ran the task
     * @param duration_ms Execution time in milliseconds
     * @param success Whether the task succeeded
     */
    void logTaskOutcome(const std::string& task_id, const std::string& model_id,
                        long duration_ms, bool success);

    /**
     * @brief Log session start
     * @param command Command being executed
     */
    void logSessionStart(const std::string& command);

    /**
     * @brief Log session end
     * @param command Command that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Parse a level name ("debug", "info", "warning", "error", "critical")
     * @param name Level name, case-insensitive
     * @return Parsed level, or INFO for unknown names
     */
    static LogLevel parseLevel(const std::string& name);

    /**
     * @brief Get log level name as string
     * @param level Log level
     * @return String representation
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    std::recursive_mutex m_mutex;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if needed
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

} // namespace Maestro
