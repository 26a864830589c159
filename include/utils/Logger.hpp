#ifndef FITKIT_LOGGER_HPP
#define FITKIT_LOGGER_HPP

#include <string>
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace fitkit {

/**
 * @enum LogLevel
 * @brief Defines severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,    ///< Detailed debugging information.
    INFO,     ///< General informational messages.
    WARNING,  ///< Indicates potential issues.
    ERROR,    ///< Errors hindering specific operations.
    FATAL     ///< Critical errors halting the program.
};

/**
 * @class Logger
 * @brief A thread-safe singleton logger.
 *
 * Messages are timestamped and tagged with severity and source, written to the
 * console and optionally to a file. Messages below the configured level are dropped.
 */
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    /**
     * @brief Configures file logging.
     *
     * @param enable   [in] True to enable file logging, false to disable.
     * @param filename [in] Path to the log file, opened in append mode.
     * @return bool False if the file could not be opened.
     */
    bool enableFileLogging(bool enable, const std::string& filename = "fitkit.log") {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (logFile_.is_open()) {
                logFile_.close();
            }
            if (enable) {
                logFile_.open(filename, std::ios::app);
                if (!logFile_.is_open()) {
                    std::cerr << formatLogMessage(LogLevel::ERROR, "Logger", "Failed to open log file: " + filename) << std::endl;
                    return false;
                }
            }
        }
        info("Logger", enable ? "File logging enabled to: " + filename : "File logging disabled.");
        return true;
    }

    /**
     * @brief Logs a message if its level meets the minimum threshold. Thread-safe.
     */
    void log(LogLevel level, const std::string& source, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) return;

        std::string formattedMessage = formatLogMessage(level, source, message);
        std::cout << formattedMessage << std::endl;
        if (logFile_.is_open()) {
            logFile_ << formattedMessage << std::endl;
        }
    }

    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

private:
    Logger() : logLevel_(LogLevel::INFO) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string formatLogMessage(LogLevel level, const std::string& source, const std::string& message) {
        std::ostringstream oss;
        auto now = std::chrono::system_clock::now();
        std::time_t time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm local_tm{};
        localtime_r(&time_t_now, &local_tm);
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << " ";

        switch (level) {
            case LogLevel::DEBUG:   oss << "[DEBUG]  "; break;
            case LogLevel::INFO:    oss << "[INFO]   "; break;
            case LogLevel::WARNING: oss << "[WARNING]"; break;
            case LogLevel::ERROR:   oss << "[ERROR]  "; break;
            case LogLevel::FATAL:   oss << "[FATAL]  "; break;
        }

        oss << " [" << source << "] " << message;
        return oss.str();
    }

    LogLevel logLevel_;         ///< Minimum level for messages to be processed.
    std::ofstream logFile_;     ///< Output file stream (if file logging is enabled).
    mutable std::mutex mutex_;  ///< Serialises level changes and output.
};

} // namespace fitkit

#endif // FITKIT_LOGGER_HPP
