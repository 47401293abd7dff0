/**
 * @file transfer_engine.h
 * @brief Resumable single-stream download into a local payload file
 *
 * TransferEngine streams a source into <dest_dir>/<name>.part, resuming from
 * the partial file's size with a byte-range request, and renames the partial
 * to <dest_dir>/<name> only once the byte count matches the advertised total.
 */

#ifndef RELAYQ_TRANSFER_ENGINE_H
#define RELAYQ_TRANSFER_ENGINE_H

#include "relayq/cancellation.h"
#include "relayq/errors.h"
#include "relayq/http_client.h"
#include "relayq/logger.h"
#include "relayq/progress.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace relayq {

/**
 * @brief Terminal outcome of a fetch
 */
enum class FetchOutcome {
    COMPLETED,  ///< Final file in place
    FAILED,     ///< Transport, status, size or file error
    CANCELLED   ///< Cancellation token fired; partial kept
};

/**
 * @brief Result of TransferEngine::fetch
 */
struct FetchResult {
    FetchOutcome outcome = FetchOutcome::FAILED;

    /// Final path when COMPLETED, otherwise the partial path (empty if none)
    std::string local_path;

    ErrorCode error_code = ErrorCode::SUCCESS;
    std::string error;

    /// Bytes received by this call (excludes resumed bytes)
    std::uint64_t bytes_received = 0;

    bool ok() const { return outcome == FetchOutcome::COMPLETED; }
};

class TransferEngine {
public:
    /**
     * @brief Construct a TransferEngine
     * @param client HTTP transport
     * @param logger Logger for transfer lifecycle messages
     * @param progress_interval Minimum interval between progress callbacks
     */
    TransferEngine(HttpClient& client, Logger& logger,
                   std::chrono::milliseconds progress_interval);

    /**
     * @brief Download source_ref to <dest_dir>/<name>
     *
     * An existing <name>.part is resumed. An existing final file with no
     * partial is returned as-is without a request. A 200 answer to a range
     * request restarts the partial from zero; a 416 answer discards it
     * (unless it already holds the whole resource).
     *
     * @param source_ref URL of the payload
     * @param dest_dir Local directory (created if missing)
     * @param name Final filename
     * @param on_progress Receives monotonic byte counts (may be empty)
     * @param cancel Polled between chunk writes
     */
    FetchResult fetch(const std::string& source_ref,
                      const std::string& dest_dir,
                      const std::string& name,
                      const ByteProgressCallback& on_progress,
                      const CancellationToken& cancel);

    /**
     * @brief Partial path for a final path ("<path>.part")
     */
    static std::string partialPathFor(const std::string& final_path);

private:
    HttpClient& client_;
    Logger& logger_;
    std::chrono::milliseconds progress_interval_;
};

} // namespace relayq

#endif // RELAYQ_TRANSFER_ENGINE_H
