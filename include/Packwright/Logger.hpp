// =================================================================
// include/Packwright/Logger.hpp
// =================================================================
// Header for console and rotating file logging.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Packwright {

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
 * @brief Process-wide logging for console feedback and audit trails
 *
 * Console output is filtered by the console level (driven by the verbosity
 * flags); every entry at or above the file level is appended to a rotating
 * log file in the cache root. Safe to call from concurrent app pipelines.
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
     * @param log_dir Directory for log files; empty picks the cache root default
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = "",
                    size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                    size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Map a -v count onto the console level
     * @param verbosity 0 = info, 1 or more = debug
     */
    void applyVerbosity(int verbosity);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log session start
     * @param command Verb being executed
     * @param target Target description (platform/format, tool names)
     */
    void logSessionStart(const std::string& command, const std::string& target);

    /**
     * @brief Log session end
     * @param command Verb that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Log a pipeline stage transition for one app
     * @param app_name App being processed
     * @param stage Stage name
     * @param state "started", "skipped", "completed" or "failed"
     */
    void logStageTransition(const std::string& app_name, const std::string& stage, const std::string& state);

    /**
     * @brief Log the outcome of one external process run
     */
    void logToolInvocation(const std::string& command_line, int exit_code,
                           const std::string& outcome, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Get log level name as string
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Get log level color for console output
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
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;
    unsigned long m_log_sequence = 0;
    std::recursive_mutex m_mutex;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

} // namespace Packwright
