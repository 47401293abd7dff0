/**
 * @file transfer_engine.cpp
 * @brief Implementation of TransferEngine
 */

#include "relayq/transfer_engine.h"
#include "relayq/task.h"

#include <filesystem>
#include <fstream>

namespace relayq {

namespace fs = std::filesystem;

TransferEngine::TransferEngine(HttpClient& client, Logger& logger,
                               std::chrono::milliseconds progress_interval)
    : client_(client), logger_(logger), progress_interval_(progress_interval) {
}

std::string TransferEngine::partialPathFor(const std::string& final_path) {
    return final_path + kPartialSuffix;
}

FetchResult TransferEngine::fetch(const std::string& source_ref,
                                  const std::string& dest_dir,
                                  const std::string& name,
                                  const ByteProgressCallback& on_progress,
                                  const CancellationToken& cancel) {
    FetchResult result;

    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        result.error_code = ErrorCode::FILE_WRITE_ERROR;
        result.error = "Cannot create download directory " + dest_dir + ": " + ec.message();
        logger_.error(result.error);
        return result;
    }

    const std::string final_path = (fs::path(dest_dir) / name).string();
    const std::string part_path = partialPathFor(final_path);

    if (fs::exists(final_path, ec) && !fs::exists(part_path, ec)) {
        logger_.info("Payload already present, skipping fetch: " + final_path);
        result.outcome = FetchOutcome::COMPLETED;
        result.local_path = final_path;
        return result;
    }

    std::uint64_t offset = 0;
    if (fs::exists(part_path, ec)) {
        offset = fs::file_size(part_path, ec);
        if (ec) {
            offset = 0;
        }
        result.local_path = part_path;
    }

    if (cancel.cancelled()) {
        result.outcome = FetchOutcome::CANCELLED;
        result.error_code = ErrorCode::TRANSFER_CANCELLED;
        result.error = "cancelled before start";
        return result;
    }

    if (offset > 0) {
        logger_.info("Resuming " + source_ref + " at byte " + std::to_string(offset) +
                     " into " + part_path);
    } else {
        logger_.info("Fetching " + source_ref + " into " + part_path);
    }

    using Clock = std::chrono::steady_clock;
    const auto started = Clock::now();
    auto last_report = started - progress_interval_;

    std::ofstream out;
    std::uint64_t base = offset;
    std::uint64_t total = 0;
    std::uint64_t received = 0;
    long status = 0;
    bool cancelled = false;
    bool unresumable = false;
    bool already_whole = false;
    ErrorCode failure_code = ErrorCode::SUCCESS;
    std::string failure;

    auto report = [&](bool force) {
        if (!on_progress) {
            return;
        }
        auto now = Clock::now();
        if (!force && now - last_report < progress_interval_) {
            return;
        }
        last_report = now;
        double elapsed = std::chrono::duration<double>(now - started).count();
        event::Transferring ev;
        ev.bytes_done = base + received;
        ev.bytes_total = total;
        ev.rate_bps = elapsed > 0.0 ? static_cast<double>(received) / elapsed : 0.0;
        on_progress(ev);
    };

    auto on_head = [&](const HttpResponseHead& head) {
        status = head.status;

        if (status == 416) {
            if (offset > 0 && head.content_range_total && *head.content_range_total == offset) {
                already_whole = true;
            } else {
                unresumable = true;
                failure_code = ErrorCode::TRANSFER_HTTP_STATUS;
                failure = "HTTP 416: partial file cannot be resumed";
            }
            return false;
        }
        if (status != 200 && status != 206) {
            failure_code = ErrorCode::TRANSFER_HTTP_STATUS;
            failure = "HTTP status " + std::to_string(status);
            return false;
        }

        if (offset > 0 && status == 200) {
            logger_.warn("Server ignored range request for " + source_ref +
                         ", restarting from zero");
            base = 0;
        }

        if (head.content_range_total) {
            total = *head.content_range_total;
        } else if (head.content_length) {
            total = *head.content_length + base;
        } else {
            total = 0;
        }

        auto mode = std::ios::binary | (base == 0 ? std::ios::trunc : std::ios::app);
        out.open(part_path, mode);
        if (!out.is_open()) {
            failure_code = ErrorCode::FILE_WRITE_ERROR;
            failure = "Cannot open " + part_path + " for writing";
            return false;
        }

        report(true);
        return true;
    };

    auto on_chunk = [&](const char* data, std::size_t size) {
        if (cancel.cancelled()) {
            cancelled = true;
            return false;
        }
        out.write(data, static_cast<std::streamsize>(size));
        if (!out) {
            failure_code = ErrorCode::FILE_WRITE_ERROR;
            failure = "Write to " + part_path + " failed";
            return false;
        }
        received += size;
        report(false);
        return true;
    };

    HttpResult http = client_.get(source_ref, offset, on_head, on_chunk);

    if (out.is_open()) {
        out.close();
        if (out.fail() && failure_code == ErrorCode::SUCCESS && !cancelled) {
            failure_code = ErrorCode::FILE_WRITE_ERROR;
            failure = "Closing " + part_path + " failed";
        }
    }
    result.bytes_received = received;
    if (fs::exists(part_path, ec)) {
        result.local_path = part_path;
    }

    if (cancelled) {
        logger_.info("Fetch of " + source_ref + " cancelled at byte " +
                     std::to_string(base + received));
        result.outcome = FetchOutcome::CANCELLED;
        result.error_code = ErrorCode::TRANSFER_CANCELLED;
        result.error = "cancelled";
        return result;
    }

    if (unresumable) {
        fs::remove(part_path, ec);
        result.local_path.clear();
        result.error_code = failure_code;
        result.error = failure;
        logger_.error("Fetch of " + source_ref + " failed: " + failure + ", partial discarded");
        return result;
    }

    if (failure_code != ErrorCode::SUCCESS) {
        result.error_code = failure_code;
        result.error = failure;
        logger_.error("Fetch of " + source_ref + " failed: " + failure);
        return result;
    }

    if (!already_whole && !http.ok) {
        result.error_code = ErrorCode::TRANSFER_FAILED;
        result.error = http.error.empty() ? "transfer failed" : http.error;
        logger_.error("Fetch of " + source_ref + " failed: " + result.error);
        return result;
    }

    const std::uint64_t final_size = already_whole ? offset : base + received;
    if (total > 0 && final_size != total) {
        result.error_code = ErrorCode::TRANSFER_SIZE_MISMATCH;
        result.error = "Size mismatch: expected " + std::to_string(total) +
                       " bytes, have " + std::to_string(final_size);
        logger_.error("Fetch of " + source_ref + " failed: " + result.error +
                      ", partial kept at " + part_path);
        return result;
    }

    if (total == 0) {
        total = final_size;
    }
    report(true);

    fs::rename(part_path, final_path, ec);
    if (ec) {
        result.error_code = ErrorCode::FILE_WRITE_ERROR;
        result.error = "Cannot rename " + part_path + " to " + final_path + ": " + ec.message();
        logger_.error(result.error);
        return result;
    }

    logger_.info("Fetched " + source_ref + " (" + std::to_string(final_size) + " bytes) to " +
                 final_path);
    result.outcome = FetchOutcome::COMPLETED;
    result.local_path = final_path;
    return result;
}

} // namespace relayq
