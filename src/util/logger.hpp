#ifndef SAFEINTAKE_UTIL_LOGGER_HPP
#define SAFEINTAKE_UTIL_LOGGER_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @file logger.hpp
 * @brief Thread-safe process logger for SafeIntake.
 *
 * Usage:
 *   - Logger::getInstance().info("[IngestionService] stored raw upload");
 *   - logger::debug("...");
 *   - logger::enableFileOutput("safeintake.log");
 *
 * Lines look like "[2026-10-17 09:14:03][WARN] [Component] message".
 * WARN and above go to stderr, the rest to stdout. Console output can be
 * muted (tests do this) while file output keeps recording.
 */

namespace safeintake {
namespace util {
namespace logger {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name ("debug", "INFO", "warning", ...).
 * @throw std::runtime_error on an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    throw std::runtime_error("Logger: unknown log level '" + name + "'");
}

inline const char *levelName(LogLevel level)
{
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Singleton logger: level filter, console sink, optional file sink.
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

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

    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleEnabled_ = enabled;
    }

    /**
     * @brief Mirror every accepted line into a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to an existing file; otherwise truncates.
     * @return false if the file could not be opened (console logging continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = true)
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
            return false;
        }
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    void debug(const std::string &msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string &msg) { log(LogLevel::INFO, msg); }
    void warn(const std::string &msg) { log(LogLevel::WARN, msg); }
    void error(const std::string &msg) { log(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, msg); }

    /**
     * @brief Core logging function; writes one line to the enabled sinks.
     */
    void log(LogLevel level, const std::string &msg)
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
        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "]["
             << levelName(level) << "] " << msg << "\n";

        if (consoleEnabled_) {
            std::ostream &out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
            out << line.str();
            out.flush();
        }

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

private:
    Logger()
        : logLevel_(LogLevel::INFO),
          consoleEnabled_(true)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool consoleEnabled_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline void setConsoleOutput(bool enabled)
{
    Logger::getInstance().setConsoleOutput(enabled);
}

inline bool enableFileOutput(const std::string &filename, bool append = true)
{
    return Logger::getInstance().enableFileOutput(filename, append);
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
} // namespace safeintake

#endif // SAFEINTAKE_UTIL_LOGGER_HPP
