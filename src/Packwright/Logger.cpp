// =================================================================
// src/Packwright/Logger.cpp
// =================================================================
// Implementation for console and rotating file logging.

#include "Packwright/Logger.hpp"
#include "Packwright/Environment.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <ctime>
#include <unistd.h>

namespace Packwright {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (log_dir.empty()) {
        auto override_dir = getEnvironment("PACKWRIGHT_LOG_DIR");
        m_log_dir = override_dir ? *override_dir : (cacheRoot() / "logs").string();
    } else {
        m_log_dir = log_dir;
    }
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;
    m_initialized = true;

    ensureLogDirectory();

    m_current_log_file.reset();
    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);

    debug("Logger", "Logging system initialized", m_log_dir);
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

void Logger::applyVerbosity(int verbosity) {
    setConsoleLogLevel(verbosity > 0 ? LogLevel::DEBUG : LogLevel::INFO);
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

void Logger::logSessionStart(const std::string& command, const std::string& target) {
    std::ostringstream context;
    context << "Command: " << command;
    if (!target.empty()) {
        context << ", Target: " << target;
    }
    debug("Session", "Session started", context.str());
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        debug("Session", "Session completed successfully", context.str());
    } else {
        debug("Session", "Session completed with errors", context.str());
    }
}

void Logger::logStageTransition(const std::string& app_name, const std::string& stage, const std::string& state) {
    if (state == "failed") {
        error(app_name, "Stage " + stage + " failed");
    } else if (state == "started") {
        info(app_name, "Running " + stage + " stage");
    } else {
        debug(app_name, "Stage " + stage + " " + state);
    }
}

void Logger::logToolInvocation(const std::string& command_line, int exit_code,
                               const std::string& outcome, long duration_ms) {
    std::ostringstream context;
    context << "Exit code: " << exit_code << ", ";
    context << "Outcome: " << outcome << ", ";
    context << "Duration: " << duration_ms << "ms";

    debug("Process", command_line, context.str());

    // Slow tools are worth a note when reading the log after the fact
    if (duration_ms > 10 * 60 * 1000) {
        debug("Process", "Long running tool", "Duration: " + std::to_string(duration_ms) + "ms");
    }
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
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
        initialize();
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    bool use_color = isatty(STDOUT_FILENO) != 0;
    std::cout << formatEntry(entry, use_color) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1;

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

    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log" &&
                entry.path() != std::filesystem::path(m_current_log_filename)) {
                log_files.push_back(entry.path());
            }
        }

        // Newest first; the file just opened always counts as one of the kept files
        std::sort(log_files.begin(), log_files.end(),
                  [](const std::filesystem::path& a, const std::filesystem::path& b) {
                      return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                  });

        size_t keep = m_max_log_files > 0 ? m_max_log_files - 1 : 0;
        for (size_t i = keep; i < log_files.size(); i++) {
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

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    // The sequence keeps names unique when rotation happens within one millisecond
    std::ostringstream filename;
    filename << m_log_dir << "/packwright_";
    filename << std::put_time(&local_tm, "%Y%m%d_%H%M%S");
    filename << "_" << std::setfill('0') << std::setw(3) << ms.count();
    filename << "_" << getpid() << "_" << m_log_sequence++ << ".log";

    return filename.str();
}

} // namespace Packwright
