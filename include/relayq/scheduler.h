/**
 * @file scheduler.h
 * @brief Scheduler class for dispatching download and upload workers
 *
 * Coordinates between TaskStore, TransferEngine and RelayEngine to keep two
 * bounded worker pools busy until both queues are drained.
 */

#ifndef RELAYQ_SCHEDULER_H
#define RELAYQ_SCHEDULER_H

#include "relayq/cancellation.h"
#include "relayq/config.h"
#include "relayq/logger.h"
#include "relayq/naming.h"
#include "relayq/relay_engine.h"
#include "relayq/task_store.h"
#include "relayq/transfer_engine.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace relayq {

/**
 * @brief Lifecycle of one scheduler run
 *
 * IDLE -> RUNNING -> (DRAINING on stop or fatal error) -> IDLE
 */
enum class SchedulerState {
    IDLE,
    RUNNING,
    DRAINING
};

inline std::string schedulerStateToString(SchedulerState state) {
    switch (state) {
        case SchedulerState::IDLE:     return "idle";
        case SchedulerState::RUNNING:  return "running";
        case SchedulerState::DRAINING: return "draining";
        default:                       return "unknown";
    }
}

/**
 * @brief Runs download and upload workers against a TaskStore
 *
 * The Scheduler is responsible for:
 * - Running a tick loop on a background thread
 * - Dispatching uploads before downloads, each pool bounded
 * - Translating engine results into terminal progress events
 * - Reaping finished workers and ending the run when nothing is left
 * - Cancelling in-flight workers on stop (their tasks become PAUSED)
 */
class Scheduler {
public:
    /**
     * @brief Construct a Scheduler
     * @param store Task store to dequeue from and report into
     * @param transfer Download engine
     * @param relay Upload engine
     * @param naming Payload naming rules
     * @param config Pool bounds, tick interval, download_dir, delete_after_upload
     * @param logger Logger for run lifecycle messages
     */
    Scheduler(TaskStore& store,
              TransferEngine& transfer,
              RelayEngine& relay,
              const ArtifactNaming& naming,
              const Config& config,
              Logger& logger);

    /**
     * @brief Destructor - stops the scheduler if running
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Start a run on a background thread
     * @return false if a run is already in progress
     */
    bool start();

    /**
     * @brief Request stop, cancel in-flight workers and wait for the run to end
     */
    void stop();

    /**
     * @brief Block until the current run ends
     */
    void wait();

    /**
     * @brief Run one scheduling pass
     *
     * Called by the loop thread; does nothing while IDLE.
     */
    void tick();

    SchedulerState state() const;

    bool isRunning() const { return state() != SchedulerState::IDLE; }

    size_t activeDownloads() const;
    size_t activeUploads() const;

    /**
     * @brief Fatal error that ended the last run (empty if none)
     */
    std::string lastError() const;

private:
    enum class WorkerKind { DOWNLOAD, UPLOAD };

    struct Worker {
        std::string task_id;
        WorkerKind kind;
        std::shared_ptr<CancellationToken> cancel;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    void loop();

    void dispatchUploads();
    void dispatchDownloads();
    void reapFinished();
    size_t countWorkers(WorkerKind kind) const;

    void runDownload(const DownloadAssignment& assignment, const CancellationToken& cancel);
    void runUpload(const UploadAssignment& assignment, const CancellationToken& cancel);

    void spawn(WorkerKind kind, const std::string& task_id,
               std::function<void(const CancellationToken&)> body);

    void recordFatal(const std::string& message);
    void cancelAll();
    void finishRun(const std::string& reason);

    TaskStore& store_;
    TransferEngine& transfer_;
    RelayEngine& relay_;
    const ArtifactNaming& naming_;
    Logger& logger_;

    size_t max_downloads_;
    size_t max_uploads_;
    std::chrono::milliseconds tick_interval_;
    std::string download_dir_;
    bool delete_after_upload_;

    SchedulerState state_ = SchedulerState::IDLE;
    std::string last_error_;
    bool wake_requested_ = false;
    mutable std::mutex state_mutex_;
    std::condition_variable wake_;

    std::vector<Worker> workers_;
    mutable std::mutex workers_mutex_;

    std::thread loop_thread_;
    std::mutex join_mutex_;
};

} // namespace relayq

#endif // RELAYQ_SCHEDULER_H
