#ifndef PIIGUARD_UTIL_LOGGER_HPP
#define PIIGUARD_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <algorithm>
#include <cctype>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for PiiGuard.
 *
 * Usage:
 *   - Logger::getInstance().info("Info message");
 *   - logger::debug("Debug message");
 *   - logger::enableFileOutput("piiguard.log");
 *
 * Log lines never carry original or replacement values, only sizes and counts.
 */

namespace piiguard {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name ("debug", "INFO", "warn", ...) into a LogLevel.
 * @throw std::runtime_error on an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug")    return LogLevel::DEBUG;
    if (lower == "info")     return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error")    return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    throw std::runtime_error("Logger: unknown log level '" + name + "'");
}

/**
 * @brief A singleton logger class that supports:
 *  - Thread-safe logging
 *  - Various log levels
 *  - Optional file output
 *  - Optional silencing of the console (used by the CLI stream mode, whose
 *    stdout carries the redacted document)
 */
class Logger {
public:
    /**
     * @brief Get the global Logger instance.
     */
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Set the minimal log level. Messages below this level are discarded.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Route console output to stderr instead of stdout.
     */
    void setConsoleToStderr(bool toStderr)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleToStderr_ = toStderr;
    }

    /**
     * @brief Enable output to a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     */
    void enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
        }
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    void debug(const std::string &msg)    { log(LogLevel::DEBUG, "DEBUG", msg); }
    void info(const std::string &msg)     { log(LogLevel::INFO, "INFO", msg); }
    void warn(const std::string &msg)     { log(LogLevel::WARN, "WARN", msg); }
    void error(const std::string &msg)    { log(LogLevel::ERROR, "ERROR", msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, "CRITICAL", msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
        , consoleToStderr_(false)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Core logging function that writes to console and optionally to a file.
     */
    void log(LogLevel level, const std::string &levelName, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif
        std::ostringstream timestamp;
        timestamp << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");

        std::ostringstream line;
        line << "[" << timestamp.str() << "][" << levelName << "] " << msg << std::endl;

        std::ostream &console = consoleToStderr_ ? std::cerr : std::cout;
        console << line.str();
        console.flush();

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool consoleToStderr_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline void enableFileOutput(const std::string &filename, bool append = false)
{
    Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().debug(msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().info(msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().warn(msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().error(msg);
}

inline void critical(const std::string &msg)
{
    Logger::getInstance().critical(msg);
}

} // namespace logger
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_LOGGER_HPP
