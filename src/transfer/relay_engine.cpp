/**
 * @file relay_engine.cpp
 * @brief Implementation of RelayEngine
 */

#include "relayq/relay_engine.h"
#include "relayq/naming.h"
#include "relayq/task.h"

#include <filesystem>
#include <fstream>
#include <vector>

namespace relayq {

namespace fs = std::filesystem;

RelayEngine::RelayEngine(RemoteStore& store, Logger& logger, std::size_t chunk_size,
                         std::chrono::milliseconds progress_interval)
    : store_(store),
      logger_(logger),
      chunk_size_(chunk_size > 0 ? chunk_size : 1024 * 1024),
      progress_interval_(progress_interval) {
}

RelayResult RelayEngine::relay(const std::string& local_path,
                               const std::string& logical_key,
                               const ByteProgressCallback& on_progress,
                               const CancellationToken& cancel) {
    RelayResult result;

    std::error_code ec;
    if (local_path.empty() || isPartialPath(local_path) ||
        !fs::is_regular_file(local_path, ec)) {
        result.outcome = RelayOutcome::SKIPPED_NOT_READY;
        result.error_code = ErrorCode::FILE_NOT_FOUND;
        result.error = "local file not ready: '" + local_path + "'";
        logger_.warn("Relay skipped, " + result.error);
        return result;
    }

    const std::uint64_t local_size = fs::file_size(local_path, ec);
    if (ec) {
        result.error_code = ErrorCode::FILE_READ_ERROR;
        result.error = "Cannot stat " + local_path + ": " + ec.message();
        logger_.error(result.error);
        return result;
    }

    const std::string file_name = fs::path(local_path).filename().string();
    const std::string remote_dir = ArtifactNaming::bucketFor(logical_key);
    result.remote_path = ArtifactNaming::remotePathFor(logical_key, file_name);

    using Clock = std::chrono::steady_clock;
    const auto started = Clock::now();
    auto last_report = started - progress_interval_;

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
        ev.bytes_done = result.bytes_sent;
        ev.bytes_total = local_size;
        ev.rate_bps = elapsed > 0.0 ? static_cast<double>(result.bytes_sent) / elapsed : 0.0;
        on_progress(ev);
    };

    try {
        store_.ensureDirectory(remote_dir);

        auto remote_size = store_.stat(result.remote_path);
        if (remote_size && *remote_size >= local_size) {
            logger_.info("Remote copy of " + logical_key + " already present (" +
                         std::to_string(*remote_size) + " bytes), skipping relay");
            result.outcome = RelayOutcome::SKIPPED_DUPLICATE;
            return result;
        }
        if (remote_size) {
            logger_.warn("Remote copy of " + logical_key + " is smaller (" +
                         std::to_string(*remote_size) + " < " + std::to_string(local_size) +
                         " bytes), overwriting");
        }

        std::ifstream in(local_path, std::ios::binary);
        if (!in.is_open()) {
            result.error_code = ErrorCode::FILE_READ_ERROR;
            result.error = "Cannot open " + local_path;
            logger_.error(result.error);
            return result;
        }

        logger_.info("Relaying " + local_path + " to " + result.remote_path);
        auto writer = store_.openWriter(result.remote_path);

        std::vector<char> buffer(chunk_size_);
        report(true);
        while (result.bytes_sent < local_size) {
            if (cancel.cancelled()) {
                logger_.info("Relay of " + logical_key + " cancelled at byte " +
                             std::to_string(result.bytes_sent));
                result.outcome = RelayOutcome::CANCELLED;
                result.error_code = ErrorCode::RELAY_CANCELLED;
                result.error = "cancelled";
                return result;
            }

            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = in.gcount();
            if (got <= 0) {
                result.error_code = ErrorCode::FILE_READ_ERROR;
                result.error = "Unexpected end of " + local_path;
                logger_.error(result.error);
                return result;
            }

            writer->write(buffer.data(), static_cast<std::size_t>(got));
            result.bytes_sent += static_cast<std::uint64_t>(got);
            report(false);
        }

        writer->commit();
        report(true);

    } catch (const RelayqException& e) {
        result.outcome = RelayOutcome::FAILED;
        result.error_code = e.code();
        result.error = e.message();
        logger_.error("Relay of " + logical_key + " failed: " + e.message());
        return result;
    }

    logger_.info("Relayed " + logical_key + " (" + std::to_string(result.bytes_sent) +
                 " bytes) to " + result.remote_path);
    result.outcome = RelayOutcome::UPLOADED;
    return result;
}

} // namespace relayq
