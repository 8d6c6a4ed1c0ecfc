// =================================================================
// include/SmartCov/Logger.hpp
// =================================================================
// Header for component-tagged console and file logging.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace SmartCov {

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

enum class CoverageScope;

/**
 * @brief Process-wide logger with console and optional rotating file output
 *
 * Console output is on by default at INFO level. File output is only
 * enabled once initialize() is called with a non-empty directory. The
 * parser worker thread logs through the same instance, so writes are
 * serialized internally.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Enable file logging
     * @param log_dir Directory for log files, empty disables file output
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir,
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

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log LCOV parse statistics
     * @param input_bytes Size of the parsed text
     * @param file_count Number of SF: records produced
     * @param skipped_records Number of malformed DA: records dropped
     * @param on_worker True if the parse ran on the worker thread
     * @param duration_ms Parse duration in milliseconds
     */
    void logParse(size_t input_bytes, size_t file_count, size_t skipped_records,
                  bool on_worker, long duration_ms);

    /**
     * @brief Log target filtering results
     * @param total_files Files in the parsed corpus
     * @param target_count Number of target paths
     * @param matched_files Files kept after filtering
     */
    void logFilter(size_t total_files, size_t target_count, size_t matched_files);

    /**
     * @brief Log which scope the analysis settled on
     * @param scope Outcome of the decision ladder
     * @param detail Extra information, e.g. the base branch
     */
    void logScopeDecision(CoverageScope scope, const std::string& detail);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param package_path Package the command runs against
     */
    void logSessionStart(const std::string& command, const std::string& package_path);

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
     * @brief Name of the file currently written, empty when file logging is off
     */
    std::string currentLogFile() const;

    static std::string getLevelName(LogLevel level);
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

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;
    mutable std::mutex m_mutex;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if needed
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    bool ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define SMARTCOV_LOG_DEBUG(component, message) \
    SmartCov::Logger::getInstance().debug(component, message)

#define SMARTCOV_LOG_INFO(component, message) \
    SmartCov::Logger::getInstance().info(component, message)

#define SMARTCOV_LOG_WARNING(component, message) \
    SmartCov::Logger::getInstance().warning(component, message)

#define SMARTCOV_LOG_ERROR(component, message) \
    SmartCov::Logger::getInstance().error(component, message)

} // namespace SmartCov
