/**
 * @file task.h
 * @brief Task record and status definitions for relayq
 *
 * Defines the Task struct which tracks one content item from discovery
 * through download, relay and completion.
 */

#ifndef RELAYQ_TASK_H
#define RELAYQ_TASK_H

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

namespace relayq {

/**
 * @brief Task lifecycle status
 *
 * - PENDING_DOWNLOAD: Waiting in the download queue
 * - DOWNLOADING: Checked out to a download worker
 * - PENDING_UPLOAD: Local file complete, waiting in the upload queue
 * - UPLOADING: Checked out to an upload worker
 * - COMPLETED: Relayed to the remote store
 * - SKIPPED_UPLOAD: Remote store already held the file
 * - PAUSED: Interrupted by a stop request
 * - ERROR: Collaborator contract violation
 * - FAILED_DOWNLOAD: Transient download failure
 * - FAILED_UPLOAD: Transient relay failure
 */
enum class TaskStatus {
    PENDING_DOWNLOAD,
    DOWNLOADING,
    PENDING_UPLOAD,
    UPLOADING,
    COMPLETED,
    SKIPPED_UPLOAD,
    PAUSED,
    ERROR,
    FAILED_DOWNLOAD,
    FAILED_UPLOAD
};

/**
 * @brief Convert TaskStatus to its persisted string form
 * @param status The task status to convert
 * @return String representation ("pending_download", "downloading", etc.)
 */
inline std::string taskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING_DOWNLOAD: return "pending_download";
        case TaskStatus::DOWNLOADING:      return "downloading";
        case TaskStatus::PENDING_UPLOAD:   return "pending_upload";
        case TaskStatus::UPLOADING:        return "uploading";
        case TaskStatus::COMPLETED:        return "completed";
        case TaskStatus::SKIPPED_UPLOAD:   return "skipped_upload";
        case TaskStatus::PAUSED:           return "paused";
        case TaskStatus::ERROR:            return "error";
        case TaskStatus::FAILED_DOWNLOAD:  return "failed_download";
        case TaskStatus::FAILED_UPLOAD:    return "failed_upload";
        default:                           return "unknown";
    }
}

/**
 * @brief Parse TaskStatus from string
 * @param str String representation of status
 * @return Corresponding TaskStatus enum value
 * @throws std::invalid_argument if string is not recognized
 */
inline TaskStatus taskStatusFromString(const std::string& str) {
    if (str == "pending_download") return TaskStatus::PENDING_DOWNLOAD;
    if (str == "downloading")      return TaskStatus::DOWNLOADING;
    if (str == "pending_upload")   return TaskStatus::PENDING_UPLOAD;
    if (str == "uploading")        return TaskStatus::UPLOADING;
    if (str == "completed")        return TaskStatus::COMPLETED;
    if (str == "skipped_upload")   return TaskStatus::SKIPPED_UPLOAD;
    if (str == "paused")           return TaskStatus::PAUSED;
    if (str == "error")            return TaskStatus::ERROR;
    if (str == "failed_download")  return TaskStatus::FAILED_DOWNLOAD;
    if (str == "failed_upload")    return TaskStatus::FAILED_UPLOAD;
    throw std::invalid_argument("Unknown task status: " + str);
}

/**
 * @brief An eligible content item handed over by the discovery side
 */
struct DiscoveredItem {
    /// Stable content identifier, becomes the TaskID
    std::string id;

    /// Human readable title, also the basis of the local file name
    std::string title;

    /// Opaque locator consumed by the transfer engine
    std::string source_ref;

    /// Free-form attributes carried through to the task record
    std::map<std::string, std::string> metadata;
};

/**
 * @brief One content item's lifecycle record
 */
struct Task {
    /// Stable content identifier
    std::string id;

    std::string title;

    /// Opaque locator used by the transfer engine
    std::string source_ref;

    /// Discovery attributes (added date, rating, ...)
    std::map<std::string, std::string> metadata;

    TaskStatus status = TaskStatus::PENDING_DOWNLOAD;

    /// Download progress in percent (0-100)
    double download_progress = 0.0;

    /// Upload progress in percent (0-100)
    double upload_progress = 0.0;

    /// Completed payload, or the partial artifact while a resume is pending
    std::string local_path;

    /// True once the orchestration layer has released (deleted) the local file
    bool local_released = false;

    /// Last failure or repair note (empty if none)
    std::string error_message;

    std::chrono::system_clock::time_point last_updated;

    /**
     * @brief Serialize task to JSON string
     * @return JSON string representation of the task
     */
    std::string toJson() const;

    /**
     * @brief Deserialize task from JSON string
     * @param json JSON string to parse
     * @return Task object
     * @throws RelayqException if JSON is invalid
     */
    static Task fromJson(const std::string& json);

    /**
     * @brief Check if the task is permanently done
     * @return true if task is COMPLETED or SKIPPED_UPLOAD
     */
    bool isFinal() const {
        return status == TaskStatus::COMPLETED ||
               status == TaskStatus::SKIPPED_UPLOAD;
    }

    /**
     * @brief Check if the task is in a retryable failure state
     * @return true if task is ERROR, FAILED_DOWNLOAD or FAILED_UPLOAD
     */
    bool isFailed() const {
        return status == TaskStatus::ERROR ||
               status == TaskStatus::FAILED_DOWNLOAD ||
               status == TaskStatus::FAILED_UPLOAD;
    }

    /**
     * @brief Check whether local_path names a partial artifact
     */
    bool hasPartialPath() const;

    /**
     * @brief Progress value to display for the current status
     * @return download progress while downloading, upload progress while
     *         uploading, 100 when completed or skipped, 0 otherwise
     */
    double displayProgress() const;

    bool operator==(const Task& other) const;

    bool operator!=(const Task& other) const {
        return !(*this == other);
    }
};

/// Suffix marking an incomplete download on disk
constexpr const char* kPartialSuffix = ".part";

/**
 * @brief Check whether a path names a partial artifact
 */
bool isPartialPath(const std::string& path);

} // namespace relayq

#endif // RELAYQ_TASK_H
