/**
 * @file logger.h
 * @brief Timestamped file logger shared by relayq components
 */

#ifndef RELAYQ_LOGGER_H
#define RELAYQ_LOGGER_H

#include <mutex>
#include <string>

namespace relayq {

/**
 * @brief Appends "[timestamp] [LEVEL] message" lines to <log_dir>/relayq.log
 *
 * A Logger constructed with an empty directory and echo disabled is silent.
 * All methods are thread-safe.
 */
class Logger {
public:
    /**
     * @brief Construct a Logger
     * @param log_dir Directory for relayq.log (empty = no file output)
     * @param echo_stderr Also write each line to stderr
     */
    explicit Logger(const std::string& log_dir = "", bool echo_stderr = false);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Write a message to the log
     * @param level Log level (DEBUG, INFO, WARN, ERROR)
     * @param message Log message
     */
    void log(const std::string& level, const std::string& message);

    void debug(const std::string& message) { log("DEBUG", message); }
    void info(const std::string& message) { log("INFO", message); }
    void warn(const std::string& message) { log("WARN", message); }
    void error(const std::string& message) { log("ERROR", message); }

    /**
     * @brief Path of the log file (empty if file logging is disabled)
     */
    std::string logFilePath() const;

    /**
     * @brief Get current timestamp string for logging
     * @return Formatted timestamp string (local time, millisecond precision)
     */
    static std::string getTimestamp();

    /**
     * @brief Create a directory recursively (like mkdir -p)
     * @param path Directory path to create
     * @return true if directory exists or was created successfully
     */
    static bool createDirectory(const std::string& path);

private:
    std::string log_dir_;
    bool echo_stderr_ = false;
    std::mutex mutex_;
};

} // namespace relayq

#endif // RELAYQ_LOGGER_H
