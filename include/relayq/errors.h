/**
 * @file errors.h
 * @brief Error codes and exception classes for relayq
 *
 * Defines error handling infrastructure including error codes and
 * a custom exception class for the relayq system.
 */

#ifndef RELAYQ_ERRORS_H
#define RELAYQ_ERRORS_H

#include <stdexcept>
#include <string>

namespace relayq {

/**
 * @brief Error codes for relayq operations
 *
 * Categorized by type:
 * - 0: Success
 * - 100-199: Task errors
 * - 200-299: Transfer errors
 * - 300-399: Relay errors
 * - 400-499: File errors
 */
enum class ErrorCode {
    SUCCESS = 0,

    // Task errors (100-199)
    TASK_NOT_FOUND = 100,
    TASK_INVALID_STATE = 101,

    // Transfer errors (200-299)
    TRANSFER_FAILED = 200,
    TRANSFER_HTTP_STATUS = 201,
    TRANSFER_SIZE_MISMATCH = 202,
    TRANSFER_CANCELLED = 203,

    // Relay errors (300-399)
    RELAY_FAILED = 300,
    RELAY_REMOTE_UNAVAILABLE = 301,
    RELAY_CANCELLED = 302,

    // File errors (400-499)
    FILE_NOT_FOUND = 400,
    FILE_PARSE_ERROR = 401,
    FILE_WRITE_ERROR = 402,
    FILE_READ_ERROR = 403,
};

/**
 * @brief Convert ErrorCode to human-readable string
 * @param code The error code to convert
 * @return String representation of the error code
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:
            return "Success";

        // Task errors
        case ErrorCode::TASK_NOT_FOUND:
            return "Task not found";
        case ErrorCode::TASK_INVALID_STATE:
            return "Invalid task state";

        // Transfer errors
        case ErrorCode::TRANSFER_FAILED:
            return "Transfer failed";
        case ErrorCode::TRANSFER_HTTP_STATUS:
            return "Unexpected HTTP status";
        case ErrorCode::TRANSFER_SIZE_MISMATCH:
            return "Transfer size mismatch";
        case ErrorCode::TRANSFER_CANCELLED:
            return "Transfer cancelled";

        // Relay errors
        case ErrorCode::RELAY_FAILED:
            return "Relay failed";
        case ErrorCode::RELAY_REMOTE_UNAVAILABLE:
            return "Remote store unavailable";
        case ErrorCode::RELAY_CANCELLED:
            return "Relay cancelled";

        // File errors
        case ErrorCode::FILE_NOT_FOUND:
            return "File not found";
        case ErrorCode::FILE_PARSE_ERROR:
            return "File parse error";
        case ErrorCode::FILE_WRITE_ERROR:
            return "Failed to write file";
        case ErrorCode::FILE_READ_ERROR:
            return "Failed to read file";

        default:
            return "Unknown error";
    }
}

/**
 * @brief Custom exception class for relayq errors
 *
 * Provides structured error handling with error codes and messages.
 */
class RelayqException : public std::runtime_error {
public:
    /**
     * @brief Construct exception with error code and message
     * @param code The error code
     * @param message Additional error message
     */
    RelayqException(ErrorCode code, const std::string& message)
        : std::runtime_error(buildMessage(code, message))
        , code_(code)
        , message_(message) {}

    /**
     * @brief Construct exception with error code only
     * @param code The error code
     */
    explicit RelayqException(ErrorCode code)
        : std::runtime_error(errorCodeToString(code))
        , code_(code)
        , message_() {}

    /**
     * @brief Get the error code
     * @return The error code associated with this exception
     */
    ErrorCode code() const noexcept { return code_; }

    /**
     * @brief Get the additional message
     * @return The additional message (may be empty)
     */
    const std::string& message() const noexcept { return message_; }

private:
    ErrorCode code_;
    std::string message_;

    static std::string buildMessage(ErrorCode code, const std::string& message) {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        return result;
    }
};

} // namespace relayq

#endif // RELAYQ_ERRORS_H
