/**
 * @file relay_engine.h
 * @brief Copies a completed local payload into the remote store
 */

#ifndef RELAYQ_RELAY_ENGINE_H
#define RELAYQ_RELAY_ENGINE_H

#include "relayq/cancellation.h"
#include "relayq/errors.h"
#include "relayq/logger.h"
#include "relayq/progress.h"
#include "relayq/remote_store.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace relayq {

/**
 * @brief Terminal outcome of a relay
 */
enum class RelayOutcome {
    UPLOADED,           ///< Bytes written and committed remotely
    SKIPPED_DUPLICATE,  ///< Remote copy at least as large as local; nothing sent
    SKIPPED_NOT_READY,  ///< Local file missing or still partial
    FAILED,
    CANCELLED
};

/**
 * @brief Result of RelayEngine::relay
 */
struct RelayResult {
    RelayOutcome outcome = RelayOutcome::FAILED;
    std::string remote_path;
    ErrorCode error_code = ErrorCode::SUCCESS;
    std::string error;
    std::uint64_t bytes_sent = 0;

    /**
     * @brief True when the bytes are durable on the remote side
     *
     * SKIPPED_NOT_READY sends nothing and is not ok(): a relay was handed a
     * source that is not a finished download, so the caller must not mark
     * the task done.
     */
    bool ok() const {
        return outcome == RelayOutcome::UPLOADED || outcome == RelayOutcome::SKIPPED_DUPLICATE;
    }

    bool skipped() const {
        return outcome == RelayOutcome::SKIPPED_DUPLICATE ||
               outcome == RelayOutcome::SKIPPED_NOT_READY;
    }
};

class RelayEngine {
public:
    /**
     * @brief Construct a RelayEngine
     * @param store Remote store to write into
     * @param logger Logger for relay lifecycle messages
     * @param chunk_size Bytes read and written per step
     * @param progress_interval Minimum interval between progress callbacks
     */
    RelayEngine(RemoteStore& store, Logger& logger, std::size_t chunk_size,
                std::chrono::milliseconds progress_interval);

    /**
     * @brief Relay local_path to "<bucket(logical_key)>/<basename>"
     *
     * A remote object at least as large as the local file is kept and the
     * relay is skipped; a smaller one is overwritten. The local file is
     * never modified or deleted.
     *
     * @param local_path Completed local payload
     * @param logical_key Key deciding the remote directory
     * @param on_progress Receives bytes sent so far (may be empty)
     * @param cancel Polled between chunks
     */
    RelayResult relay(const std::string& local_path,
                      const std::string& logical_key,
                      const ByteProgressCallback& on_progress,
                      const CancellationToken& cancel);

private:
    RemoteStore& store_;
    Logger& logger_;
    std::size_t chunk_size_;
    std::chrono::milliseconds progress_interval_;
};

} // namespace relayq

#endif // RELAYQ_RELAY_ENGINE_H
