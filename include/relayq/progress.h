/**
 * @file progress.h
 * @brief Progress events reported by transfer and relay workers
 *
 * A closed set of event types consumed by TaskStore's transition logic.
 * Each worker ends with exactly one terminal event (Finished, Failed,
 * Paused or Skipped); Transferring may be reported any number of times
 * before that.
 */

#ifndef RELAYQ_PROGRESS_H
#define RELAYQ_PROGRESS_H

#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace relayq {

/**
 * @brief Why a transfer or relay failed
 *
 * - TRANSIENT: network failure or unexpected status, retryable
 * - CONTRACT_VIOLATION: a collaborator broke its contract (finished without
 *   a file, upload source vanished)
 */
enum class FailureKind {
    TRANSIENT,
    CONTRACT_VIOLATION
};

namespace event {

/// Bytes moved so far; bytes_total is 0 when unknown
struct Transferring {
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
    double rate_bps = 0.0;
};

struct Finished {
    std::string local_path;
};

struct Failed {
    FailureKind kind = FailureKind::TRANSIENT;
    std::string reason;
};

struct Paused {
    std::string reason;
};

struct Skipped {
    std::string reason;
};

} // namespace event

using ProgressEvent = std::variant<event::Transferring,
                                   event::Finished,
                                   event::Failed,
                                   event::Paused,
                                   event::Skipped>;

/**
 * @brief Check whether an event ends a worker's run
 */
inline bool isTerminal(const ProgressEvent& ev) {
    return !std::holds_alternative<event::Transferring>(ev);
}

/**
 * @brief Percentage for a byte count, 0 when the total is unknown
 */
inline double percentOf(std::uint64_t done, std::uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    double pct = static_cast<double>(done) * 100.0 / static_cast<double>(total);
    return pct > 100.0 ? 100.0 : pct;
}

/**
 * @brief Callback receiving byte-level progress from an engine
 */
using ByteProgressCallback = std::function<void(const event::Transferring&)>;

} // namespace relayq

#endif // RELAYQ_PROGRESS_H
