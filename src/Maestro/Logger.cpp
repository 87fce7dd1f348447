// =================================================================
// src/Maestro/Logger.cpp
// =================================================================
// Implementation for the orchestration logging system.

#include "Maestro/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <vector>
#include <cctype>
#include <ctime>

namespace Maestro {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;
    m_initialized = true;

    m_current_log_file.reset();
    if (m_file_enabled) {
        ensureLogDirectory();
        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    }

    info("Logger", "Logging system initialized", m_log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::setFileLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file_enabled = enabled;
    if (!enabled) {
        if (m_current_log_file) {
            m_current_log_file->flush();
        }
        m_current_log_file.reset();
    }
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logAllocation(const std::string& reservation_id, double memory_mb,
                           double cpu, double tokens, bool success) {
    std::ostringstream context;
    context << std::fixed << std::setprecision(2);
    context << "Memory: " << memory_mb << "MB, ";
    context << "CPU: " << cpu << ", ";
    context << "Tokens: " << tokens << "/s";

    if (success) {
        debug("ResourceAllocator", "Reserved " + reservation_id, context.str());
    } else {
        warning("ResourceAllocator", "Reservation failed", context.str());
    }
}

void Logger::logDegradationChange(const std::string& from, const std::string& to,
                                  double memory_percent) {
    std::ostringstream context;
    context << "Memory usage: " << std::fixed << std::setprecision(1) << memory_percent << "%";

    std::string message = "Degradation level " + from + " -> " + to;
    if (to == "Critical") {
        critical("DegradationController", message, context.str());
    } else if (to == "None") {
        info("DegradationController", message, context.str());
    } else {
        warning("DegradationController", message, context.str());
    }
}

void Logger::logModelTransition(const std::string& action, const std::string& model_id,
                                uint64_t memory_bytes) {
    std::ostringstream context;
    context << "Memory: " << std::fixed << std::setprecision(2)
            << (static_cast<double>(memory_bytes) / (1024.0 * 1024.0 * 1024.0)) << "GB";

    info("SequentialOrchestrator", "Model " + action + ": " + model_id, context.str());
}

void Logger::logTaskOutcome(const std::string& task_id, const std::string& model_id,
                            long duration_ms, bool success) {
    std::ostringstream context;
    context << "Model: " << model_id << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (success) {
        info("Task", "Task " + task_id + " completed", context.str());
    } else {
        error("Task", "Task " + task_id + " failed", context.str());
    }

    if (duration_ms > 30000) { // > 30 seconds
        warning("Task", "Slow task detected", "Duration: " + std::to_string(duration_ms) + "ms");
    }
}

void Logger::logSessionStart(const std::string& command) {
    info("Session", "Session started", "Command: " + command);
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
    }
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical" || lowered == "crit") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (!m_initialized) {
        // Initialize with defaults if not done yet
        initialize();
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    std::string formatted = formatEntry(entry, true);
    if (entry.level >= LogLevel::ERROR) {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_file_enabled || !m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_current_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1; // +1 for newline

    // Flush critical and error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    m_current_log_size = 0;

    // Clean up old log files
    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                 [](const std::filesystem::path& a, const std::filesystem::path& b) {
                     return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                 });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }

    } catch (const std::exception& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        // Fall back to current directory
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::ostringstream stem;
    stem << m_log_dir << "/maestro_";
    stem << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");

    // Rotations within the same second get a sequence suffix
    std::string filename = stem.str() + ".log";
    for (int sequence = 1; std::filesystem::exists(filename); ++sequence) {
        filename = stem.str() + "_" + std::to_string(sequence) + ".log";
    }

    return filename;
}

} // namespace Maestro
