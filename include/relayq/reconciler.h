/**
 * @file reconciler.h
 * @brief Startup reconciliation of local artifacts against the TaskStore
 */

#ifndef RELAYQ_RECONCILER_H
#define RELAYQ_RECONCILER_H

#include "relayq/logger.h"
#include "relayq/task_store.h"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relayq {

/**
 * @brief Maps a local artifact filename to the logical key (TaskID) it
 *        belongs to, or nullopt when no key can be derived
 */
using ArtifactKeyFn = std::function<std::optional<std::string>(const std::string& file_name)>;

/**
 * @brief Payload filename a task's download produces
 */
using ArtifactNameFn = std::function<std::string(const Task& task)>;

/**
 * @brief What one reconciliation pass changed
 */
struct ReconcileReport {
    size_t adopted_files = 0;
    size_t resumed_partials = 0;
    size_t deleted_partials = 0;
    size_t reset_missing = 0;
    size_t errored_missing = 0;
    size_t requeued_stale = 0;

    /// Files removed from disk
    std::vector<std::string> deleted_paths;

    std::string summary() const;
};

/**
 * @brief Brings registry and disk into agreement before a run
 *
 * Passes, in order:
 * 1. Completed payloads whose task is neither final nor in flight join the
 *    upload queue.
 * 2. Partial files are resumed, or deleted when orphaned or unowned.
 * 3. In-flight tasks whose local file vanished are reset or errored.
 * 4. Tasks left DOWNLOADING/UPLOADING by a crash are requeued.
 */
class Reconciler {
public:
    /**
     * @brief Construct a Reconciler
     * @param store Task store to repair
     * @param key_of Filename to TaskID mapping
     * @param payload_extension Extension of completed payload files
     * @param logger Logger for repairs
     * @param name_of Expected payload name per task. A file matching a
     *        task's name or recorded local path belongs to that task
     *        before key_of is consulted.
     */
    Reconciler(TaskStore& store, ArtifactKeyFn key_of,
               const std::string& payload_extension, Logger& logger,
               ArtifactNameFn name_of = nullptr);

    /**
     * @brief Run all passes against one download directory
     * @throws RelayqException if the store cannot persist a repair
     */
    ReconcileReport reconcile(const std::string& download_dir);

private:
    void adoptCompletedFiles(const std::vector<std::string>& files, ReconcileReport& report);
    void reconcilePartials(const std::vector<std::string>& files, ReconcileReport& report);
    void repairMissingFiles(ReconcileReport& report);

    std::map<std::string, std::string> knownArtifactNames() const;
    std::optional<std::string> ownerOf(const std::string& file_name,
                                       const std::map<std::string, std::string>& known) const;

    bool deleteFile(const std::string& path, ReconcileReport& report);
    bool isPayload(const std::string& file_name) const;

    TaskStore& store_;
    ArtifactKeyFn key_of_;
    ArtifactNameFn name_of_;
    std::string payload_extension_;
    Logger& logger_;
};

} // namespace relayq

#endif // RELAYQ_RECONCILER_H
