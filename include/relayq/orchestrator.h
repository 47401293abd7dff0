/**
 * @file orchestrator.h
 * @brief Orchestrator class that integrates all relayq components
 *
 * The control surface used by the CLI: owns the TaskStore, both engines,
 * the Reconciler and the Scheduler, and exposes submission, run control
 * and status queries.
 */

#ifndef RELAYQ_ORCHESTRATOR_H
#define RELAYQ_ORCHESTRATOR_H

#include "relayq/config.h"
#include "relayq/http_client.h"
#include "relayq/logger.h"
#include "relayq/naming.h"
#include "relayq/reconciler.h"
#include "relayq/relay_engine.h"
#include "relayq/remote_store.h"
#include "relayq/scheduler.h"
#include "relayq/task_store.h"
#include "relayq/transfer_engine.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relayq {

/**
 * @brief What happened to one discovery batch
 */
struct SubmitSummary {
    size_t queued = 0;             ///< New download tasks
    size_t fast_path = 0;          ///< Complete local file found, queued for upload
    size_t already_known = 0;      ///< Pending, in flight, paused or done
    size_t already_processed = 0;  ///< In the processed-set
    size_t capped = 0;             ///< Dropped by max_queue_size
    size_t invalid = 0;            ///< No ID

    std::string toJson() const;
};

/**
 * @brief Store snapshot plus scheduler state
 */
struct OrchestratorStatus {
    StatusSnapshot store;
    SchedulerState scheduler_state = SchedulerState::IDLE;
    size_t active_downloads = 0;
    size_t active_uploads = 0;
    std::string last_error;

    std::string toJson() const;
};

/**
 * @brief Wires relayq components together
 *
 * Integrates all components:
 * - TaskStore for durable task state
 * - TransferEngine over an HttpClient (libcurl by default)
 * - RelayEngine over a RemoteStore (mounted directory by default)
 * - Reconciler for startup repair
 * - Scheduler for the worker pools
 */
class Orchestrator {
public:
    /**
     * @brief Construct with the default transports
     * @param config Configuration (paths must be resolved)
     */
    explicit Orchestrator(const Config& config);

    /**
     * @brief Construct with injected transports
     * @param config Configuration
     * @param http HTTP client for downloads
     * @param remote Remote store for uploads
     */
    Orchestrator(const Config& config,
                 std::unique_ptr<HttpClient> http,
                 std::unique_ptr<RemoteStore> remote);

    /**
     * @brief Destructor - stops a running scheduler
     */
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Load persisted task state
     */
    void load();

    /**
     * @brief Submit a discovery batch
     *
     * Processed IDs are skipped, items whose complete file already sits in
     * download_dir go straight to the upload queue, and new downloads are
     * capped so the download queue stays within max_queue_size.
     */
    SubmitSummary submit(const std::vector<DiscoveredItem>& items);

    /**
     * @brief Reconcile download_dir against the store
     */
    ReconcileReport reconcile();

    /**
     * @brief Clear the stop flag, reconcile and start a scheduler run
     * @return false if a run is already in progress
     */
    bool start();

    /**
     * @brief Stop the current run; in-flight tasks become PAUSED
     */
    void stop();

    /**
     * @brief Block until the current run ends
     */
    void wait();

    /**
     * @brief start() then wait()
     * @return true if the run ended without a fatal error
     */
    bool runToCompletion();

    /**
     * @brief Requeue PAUSED tasks
     */
    size_t resume();

    /**
     * @brief Requeue failed tasks for a fresh download
     */
    size_t resetFailed();

    /**
     * @brief Drop all task state
     * @throws RelayqException if a run is in progress
     */
    void resetAll();

    OrchestratorStatus queryAllStatus() const;

    std::optional<Task> getTask(const std::string& id) const;

    uint64_t version() const;

    bool waitForChange(uint64_t seen_version, std::chrono::milliseconds timeout) const;

    bool waitForAllUploads(std::chrono::milliseconds timeout) const;

    /**
     * @brief Read a discovery manifest
     *
     * Accepts a JSON array of items, or an object with an "items" array.
     * Each item has "id", "title", "source_ref" (or "url") and an optional
     * "metadata" object.
     *
     * @throws RelayqException if the file is missing or malformed
     */
    static std::vector<DiscoveredItem> loadManifest(const std::string& path);

    const Config& getConfig() const { return config_; }
    TaskStore& getTaskStore() { return *store_; }
    Scheduler& getScheduler() { return *scheduler_; }
    Logger& getLogger() { return *logger_; }
    const ArtifactNaming& getNaming() const { return *naming_; }

private:
    void init(std::unique_ptr<HttpClient> http, std::unique_ptr<RemoteStore> remote);

    Config config_;

    std::unique_ptr<Logger> logger_;
    std::unique_ptr<TaskStore> store_;
    std::unique_ptr<ArtifactNaming> naming_;
    std::unique_ptr<HttpClient> http_;
    std::unique_ptr<RemoteStore> remote_;
    std::unique_ptr<TransferEngine> transfer_;
    std::unique_ptr<RelayEngine> relay_;
    std::unique_ptr<Reconciler> reconciler_;
    std::unique_ptr<Scheduler> scheduler_;
};

} // namespace relayq

#endif // RELAYQ_ORCHESTRATOR_H
