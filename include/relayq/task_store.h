/**
 * @file task_store.h
 * @brief TaskStore class: durable task registry with download/upload queues
 *
 * TaskStore is the single owner of every Task record, the two pending
 * queues and the processed-set. Every public method is one atomic state
 * transition guarded by a store-wide mutex; every mutation rewrites the
 * whole snapshot file before the lock is released.
 */

#ifndef RELAYQ_TASK_STORE_H
#define RELAYQ_TASK_STORE_H

#include "relayq/logger.h"
#include "relayq/progress.h"
#include "relayq/task.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace relayq {

/**
 * @brief Outcome of a submission to the store
 */
enum class EnqueueResult {
    QUEUED,             ///< Task created or requeued
    ALREADY_ACTIVE,     ///< Task pending, in flight, paused or done; no-op
    ALREADY_PROCESSED,  ///< ID is in the processed-set; no-op
    INVALID             ///< Empty ID or unusable local path
};

/**
 * @brief Work handed to a download worker
 */
struct DownloadAssignment {
    std::string id;
    std::string title;
    std::string source_ref;
    /// Partial artifact to resume from (may be empty)
    std::string local_path;
};

/**
 * @brief Work handed to an upload worker
 */
struct UploadAssignment {
    std::string id;
    std::string title;
    std::string local_path;
};

/**
 * @brief What reconciliation decided for a partial artifact
 */
enum class PartialDisposition {
    RESUMED,   ///< Owning task requeued for download from the partial
    ORPHANED,  ///< Owning task already has a complete payload; delete the partial
    NO_OWNER,  ///< No task owns the partial; delete it
    IGNORED    ///< Owning task is in a state that leaves the partial alone
};

/**
 * @brief What reconciliation did for a task whose local file is gone
 */
enum class MissingFileRepair {
    NONE,
    RESET_TO_DOWNLOAD,
    MARKED_ERROR
};

/**
 * @brief Point-in-time view of the whole store for the control surface
 */
struct StatusSnapshot {
    std::vector<Task> tasks;
    size_t download_queue_count = 0;
    size_t upload_queue_count = 0;
    size_t processed_count = 0;
    bool stop_requested = false;

    /**
     * @brief Serialize to JSON, including a derived "progress" per task
     */
    std::string toJson() const;
};

class TaskStore {
public:
    /**
     * @brief Construct a TaskStore backed by a snapshot file
     * @param state_file Path of the snapshot file (empty = in-memory only)
     * @param logger Logger for state transitions
     */
    TaskStore(const std::string& state_file, Logger& logger);

    ~TaskStore() = default;

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    /**
     * @brief Load the snapshot file, replacing in-memory state
     *
     * A missing file starts an empty store. A corrupt file is moved aside to
     * <state_file>.corrupt and the store starts empty. Queue entries that do
     * not agree with the registry are dropped.
     */
    void load();

    // ========== Discovery ==========

    /**
     * @brief Submit a discovered item for download
     *
     * Unknown IDs become PENDING_DOWNLOAD at the back of the download queue.
     * Failed tasks are requeued with the refreshed item. Anything pending,
     * in flight, paused, completed or processed is left untouched.
     */
    EnqueueResult enqueueDownload(const DiscoveredItem& item);

    /**
     * @brief Fast path for content whose complete file is already on disk
     * @param item The discovered item
     * @param local_path Complete payload file
     *
     * The task skips the download and joins the back of the upload queue.
     */
    EnqueueResult markDownloadComplete(const DiscoveredItem& item,
                                       const std::string& local_path);

    // ========== Download side ==========

    /**
     * @brief Check out the head of the download queue
     * @return Assignment, or nullopt if stopped or the queue is empty
     */
    std::optional<DownloadAssignment> dequeueDownload();

    /**
     * @brief Apply a download progress event to a checked-out task
     * @return true if the event was applied, false if the task is unknown or
     *         not DOWNLOADING
     */
    bool updateDownloadProgress(const std::string& id, const ProgressEvent& ev);

    // ========== Upload side ==========

    std::optional<UploadAssignment> dequeueUpload();

    bool updateUploadProgress(const std::string& id, const ProgressEvent& ev);

    /**
     * @brief Release the local payload of a completed task
     * @param id Task ID
     * @param delete_file Remove the file from disk
     * @return true if the task's local file is now released
     */
    bool releaseLocalFile(const std::string& id, bool delete_file);

    // ========== Recovery ==========

    /**
     * @brief Requeue PAUSED tasks at the front of the matching queue
     * @return Number of tasks requeued
     */
    size_t resumePausedTasks();

    /**
     * @brief Reset ERROR/FAILED_* tasks to the front of the download queue
     * @return Number of tasks reset
     */
    size_t resetFailedTasks();

    /**
     * @brief Drop every task, queue entry and processed ID
     */
    void resetAll();

    // ========== Reconciliation primitives ==========

    /**
     * @brief Adopt a complete payload found on disk
     * @return true if the task was (re)created as PENDING_UPLOAD
     */
    bool adoptCompletedFile(const std::string& id, const std::string& path);

    /**
     * @brief Decide the fate of a partial artifact found on disk
     */
    PartialDisposition resumePartialFile(const std::string& id,
                                         const std::string& part_path);

    /**
     * @brief Repair a task whose recorded local file no longer exists
     */
    MissingFileRepair repairMissingLocalFile(const std::string& id);

    /**
     * @brief Return DOWNLOADING/UPLOADING tasks left by a crash to the
     *        front of their pending queue
     * @return Number of tasks requeued
     */
    size_t requeueStaleInFlight();

    // ========== Stop flag ==========

    void requestStop();
    void clearStop();
    bool isStopRequested() const;

    // ========== Queries ==========

    std::optional<Task> getTask(const std::string& id) const;
    std::vector<Task> getAllTasks() const;
    StatusSnapshot queryAllStatus() const;
    std::set<std::string> getProcessedIds() const;
    bool isProcessed(const std::string& id) const;
    std::vector<std::string> downloadQueue() const;
    std::vector<std::string> uploadQueue() const;

    /**
     * @brief Check that the upload queue is empty and nothing is UPLOADING
     */
    bool allUploadsCompleted() const;

    /**
     * @brief List violated store invariants (empty when consistent)
     */
    std::vector<std::string> checkInvariants() const;

    // ========== Change notification ==========

    /**
     * @brief Monotonic counter bumped after every mutation
     */
    uint64_t version() const;

    /**
     * @brief Block until version() differs from seen_version
     * @return true if a change happened before the timeout
     */
    bool waitForChange(uint64_t seen_version, std::chrono::milliseconds timeout) const;

    /**
     * @brief Block until allUploadsCompleted() holds
     * @return true if uploads completed before the timeout
     */
    bool waitForAllUploads(std::chrono::milliseconds timeout) const;

    const std::string& stateFile() const { return state_file_; }

private:
    struct State {
        std::map<std::string, Task> tasks;
        std::deque<std::string> download_queue;
        std::deque<std::string> upload_queue;
        std::set<std::string> processed_ids;
    };

    /**
     * @brief Persist the current state and notify observers
     * @param backup State to restore if persisting fails
     * @throws RelayqException if the snapshot cannot be written
     */
    void commitLocked(State backup);

    void persistLocked() const;
    void notifyLocked();

    std::string serializeLocked() const;
    void validateLoadedLocked();

    Task& createTaskLocked(const DiscoveredItem& item);
    void applyDownloadEventLocked(Task& task, const ProgressEvent& ev);
    void applyUploadEventLocked(Task& task, const ProgressEvent& ev);

    bool allUploadsCompletedLocked() const;

    static void touch(Task& task);
    static bool contains(const std::deque<std::string>& queue, const std::string& id);
    static void removeFrom(std::deque<std::string>& queue, const std::string& id);

    std::string state_file_;
    Logger& logger_;

    State state_;
    bool stop_requested_ = false;

    uint64_t version_ = 0;
    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
};

} // namespace relayq

#endif // RELAYQ_TASK_STORE_H
