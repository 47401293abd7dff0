/**
 * @file cancellation.h
 * @brief Cooperative cancellation token shared between scheduler and workers
 */

#ifndef RELAYQ_CANCELLATION_H
#define RELAYQ_CANCELLATION_H

#include <atomic>

namespace relayq {

/**
 * @brief One-shot cancellation flag
 *
 * The scheduler calls cancel(); engines poll cancelled() between chunk
 * writes and return cleanly when it is set.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true); }

    bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace relayq

#endif // RELAYQ_CANCELLATION_H
