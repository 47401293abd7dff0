/**
 * @file orchestrator.cpp
 * @brief Implementation of Orchestrator class
 *
 * Builds the component graph from a Config and forwards run control to the
 * Scheduler.
 */

#include "relayq/orchestrator.h"
#include "relayq/curl_http_client.h"
#include "relayq/errors.h"
#include "relayq/filesystem_remote_store.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace relayq {

namespace fs = std::filesystem;

std::string SubmitSummary::toJson() const {
    nlohmann::json j;
    j["queued"] = queued;
    j["fast_path"] = fast_path;
    j["already_known"] = already_known;
    j["already_processed"] = already_processed;
    j["capped"] = capped;
    j["invalid"] = invalid;
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string OrchestratorStatus::toJson() const {
    nlohmann::json j = nlohmann::json::parse(store.toJson());
    j["scheduler_state"] = schedulerStateToString(scheduler_state);
    j["active_downloads"] = active_downloads;
    j["active_uploads"] = active_uploads;
    if (!last_error.empty()) {
        j["last_error"] = last_error;
    }
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

Orchestrator::Orchestrator(const Config& config)
    : config_(config) {
    CurlOptions options;
    options.user_agent = config_.user_agent;
    options.connect_timeout_s = config_.connect_timeout_s;
    options.buffer_size = static_cast<long>(config_.download_chunk_size);

    init(std::make_unique<CurlHttpClient>(options),
         std::make_unique<FilesystemRemoteStore>(config_.remote_root));
}

Orchestrator::Orchestrator(const Config& config,
                           std::unique_ptr<HttpClient> http,
                           std::unique_ptr<RemoteStore> remote)
    : config_(config) {
    init(std::move(http), std::move(remote));
}

Orchestrator::~Orchestrator() {
    if (scheduler_ && scheduler_->isRunning()) {
        logger_->info("Orchestrator shutting down, stopping run");
        scheduler_->stop();
    }
}

void Orchestrator::init(std::unique_ptr<HttpClient> http, std::unique_ptr<RemoteStore> remote) {
    if (!http || !remote) {
        throw RelayqException(ErrorCode::TASK_INVALID_STATE,
                              "Orchestrator needs an HTTP client and a remote store");
    }

    logger_ = std::make_unique<Logger>(config_.enable_logging ? config_.log_dir : "",
                                       config_.log_to_stderr);

    if (!config_.data_dir.empty() && !Logger::createDirectory(config_.data_dir)) {
        throw RelayqException(ErrorCode::FILE_WRITE_ERROR,
                              "Failed to create data directory: " + config_.data_dir);
    }

    store_ = std::make_unique<TaskStore>(config_.stateFilePath(), *logger_);
    naming_ = std::make_unique<ArtifactNaming>(config_.payload_extension, config_.id_pattern);
    http_ = std::move(http);
    remote_ = std::move(remote);

    auto interval = std::chrono::milliseconds(config_.progress_interval_ms);
    transfer_ = std::make_unique<TransferEngine>(*http_, *logger_, interval);
    relay_ = std::make_unique<RelayEngine>(*remote_, *logger_, config_.relay_chunk_size, interval);

    const ArtifactNaming& naming = *naming_;
    reconciler_ = std::make_unique<Reconciler>(
        *store_,
        [&naming](const std::string& file_name) { return naming.idFromFileName(file_name); },
        config_.payload_extension,
        *logger_,
        [&naming](const Task& task) {
            DiscoveredItem item;
            item.id = task.id;
            item.title = task.title;
            return naming.payloadFileName(item);
        });

    scheduler_ = std::make_unique<Scheduler>(*store_, *transfer_, *relay_, *naming_,
                                             config_, *logger_);

    logger_->debug("Config: data_dir=" + config_.data_dir +
                   ", download_dir=" + config_.download_dir +
                   ", remote_root=" + config_.remote_root +
                   ", max_downloads=" + std::to_string(config_.max_concurrent_downloads) +
                   ", max_uploads=" + std::to_string(config_.max_concurrent_uploads));
}

void Orchestrator::load() {
    store_->load();
    logger_->info("Task state loaded from " +
                  (store_->stateFile().empty() ? std::string("<memory>") : store_->stateFile()));
}

SubmitSummary Orchestrator::submit(const std::vector<DiscoveredItem>& items) {
    SubmitSummary summary;

    // Room left in the download queue for this batch (negative cap = unlimited)
    long room = -1;
    if (config_.max_queue_size > 0) {
        room = static_cast<long>(config_.max_queue_size) -
               static_cast<long>(store_->downloadQueue().size());
        if (room < 0) {
            room = 0;
        }
    }

    for (const auto& item : items) {
        if (item.id.empty()) {
            ++summary.invalid;
            continue;
        }
        if (store_->isProcessed(item.id)) {
            ++summary.already_processed;
            continue;
        }

        auto existing = store_->getTask(item.id);
        if (existing && !existing->isFailed()) {
            ++summary.already_known;
            continue;
        }

        std::string candidate = (fs::path(config_.download_dir) /
                                 naming_->payloadFileName(item)).string();
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && fs::file_size(candidate, ec) > 0 && !ec) {
            EnqueueResult result = store_->markDownloadComplete(item, candidate);
            if (result == EnqueueResult::QUEUED) {
                logger_->info("Complete file already present for " + item.id +
                              ", queued for upload");
                ++summary.fast_path;
                continue;
            }
        }

        if (room == 0) {
            ++summary.capped;
            continue;
        }

        switch (store_->enqueueDownload(item)) {
            case EnqueueResult::QUEUED:
                ++summary.queued;
                if (room > 0) {
                    --room;
                }
                break;
            case EnqueueResult::ALREADY_ACTIVE:
                ++summary.already_known;
                break;
            case EnqueueResult::ALREADY_PROCESSED:
                ++summary.already_processed;
                break;
            case EnqueueResult::INVALID:
                ++summary.invalid;
                break;
        }
    }

    logger_->info("Submitted " + std::to_string(items.size()) + " items: " +
                  std::to_string(summary.queued) + " queued, " +
                  std::to_string(summary.fast_path) + " fast path, " +
                  std::to_string(summary.capped) + " capped");
    return summary;
}

ReconcileReport Orchestrator::reconcile() {
    return reconciler_->reconcile(config_.download_dir);
}

bool Orchestrator::start() {
    if (scheduler_->isRunning()) {
        logger_->warn("Run already in progress");
        return false;
    }

    store_->clearStop();
    reconcile();
    return scheduler_->start();
}

void Orchestrator::stop() {
    scheduler_->stop();
}

void Orchestrator::wait() {
    scheduler_->wait();
}

bool Orchestrator::runToCompletion() {
    if (!start()) {
        return false;
    }
    wait();

    std::string error = scheduler_->lastError();
    if (!error.empty()) {
        logger_->error("Run ended with a fatal error: " + error);
        return false;
    }
    return true;
}

size_t Orchestrator::resume() {
    size_t count = store_->resumePausedTasks();
    logger_->info("Resumed " + std::to_string(count) + " paused tasks");
    return count;
}

size_t Orchestrator::resetFailed() {
    size_t count = store_->resetFailedTasks();
    logger_->info("Reset " + std::to_string(count) + " failed tasks");
    return count;
}

void Orchestrator::resetAll() {
    if (scheduler_->isRunning()) {
        throw RelayqException(ErrorCode::TASK_INVALID_STATE,
                              "Cannot reset task state while a run is in progress");
    }
    store_->resetAll();
    logger_->info("All task state dropped");
}

OrchestratorStatus Orchestrator::queryAllStatus() const {
    OrchestratorStatus status;
    status.store = store_->queryAllStatus();
    status.scheduler_state = scheduler_->state();
    status.active_downloads = scheduler_->activeDownloads();
    status.active_uploads = scheduler_->activeUploads();
    status.last_error = scheduler_->lastError();
    return status;
}

std::optional<Task> Orchestrator::getTask(const std::string& id) const {
    return store_->getTask(id);
}

uint64_t Orchestrator::version() const {
    return store_->version();
}

bool Orchestrator::waitForChange(uint64_t seen_version, std::chrono::milliseconds timeout) const {
    return store_->waitForChange(seen_version, timeout);
}

bool Orchestrator::waitForAllUploads(std::chrono::milliseconds timeout) const {
    return store_->waitForAllUploads(timeout);
}

std::vector<DiscoveredItem> Orchestrator::loadManifest(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw RelayqException(ErrorCode::FILE_NOT_FOUND, "Manifest not found: " + path);
    }

    std::vector<DiscoveredItem> items;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        const nlohmann::json* list = &j;
        if (j.is_object()) {
            if (!j.contains("items")) {
                throw RelayqException(ErrorCode::FILE_PARSE_ERROR,
                                      "Manifest object has no \"items\": " + path);
            }
            list = &j["items"];
        }
        if (!list->is_array()) {
            throw RelayqException(ErrorCode::FILE_PARSE_ERROR,
                                  "Manifest items must be an array: " + path);
        }

        for (const auto& entry : *list) {
            DiscoveredItem item;
            item.id = entry.value("id", "");
            item.title = entry.value("title", "");
            item.source_ref = entry.value("source_ref", entry.value("url", ""));
            if (entry.contains("metadata") && entry["metadata"].is_object()) {
                for (auto it = entry["metadata"].begin(); it != entry["metadata"].end(); ++it) {
                    item.metadata[it.key()] =
                        it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
                }
            }
            items.push_back(std::move(item));
        }
    } catch (const nlohmann::json::exception& e) {
        throw RelayqException(ErrorCode::FILE_PARSE_ERROR,
                              "Manifest parse error in " + path + ": " + e.what());
    }
    return items;
}

} // namespace relayq
