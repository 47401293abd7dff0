/**
 * @file scheduler.cpp
 * @brief Implementation of Scheduler class
 *
 * One loop thread ticks the scheduler; each in-flight transfer runs on its
 * own worker thread and ends by posting exactly one terminal event to the
 * TaskStore.
 */

#include "relayq/scheduler.h"
#include "relayq/errors.h"

#include <algorithm>
#include <cstring>
#include <filesystem>

namespace relayq {

namespace fs = std::filesystem;

Scheduler::Scheduler(TaskStore& store,
                     TransferEngine& transfer,
                     RelayEngine& relay,
                     const ArtifactNaming& naming,
                     const Config& config,
                     Logger& logger)
    : store_(store)
    , transfer_(transfer)
    , relay_(relay)
    , naming_(naming)
    , logger_(logger)
    , max_downloads_(static_cast<size_t>(std::max(1, config.max_concurrent_downloads)))
    , max_uploads_(static_cast<size_t>(std::max(1, config.max_concurrent_uploads)))
    , tick_interval_(std::max(1, config.tick_interval_ms))
    , download_dir_(config.download_dir)
    , delete_after_upload_(config.delete_after_upload) {
}

Scheduler::~Scheduler() {
    if (state() != SchedulerState::IDLE) {
        stop();
    } else {
        wait();
    }
}

bool Scheduler::start() {
    std::lock_guard<std::mutex> join_lock(join_mutex_);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SchedulerState::IDLE) {
            return false;
        }
    }

    // Previous run already finished; collect its thread
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = SchedulerState::RUNNING;
        last_error_.clear();
        wake_requested_ = false;
    }

    logger_.info("Scheduler started (downloads " + std::to_string(max_downloads_) +
                 ", uploads " + std::to_string(max_uploads_) + ")");
    loop_thread_ = std::thread(&Scheduler::loop, this);
    return true;
}

void Scheduler::stop() {
    store_.requestStop();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SchedulerState::RUNNING) {
            state_ = SchedulerState::DRAINING;
            logger_.info("Scheduler stopping, cancelling in-flight workers");
        }
        wake_requested_ = true;
    }
    wake_.notify_all();

    cancelAll();
    wait();
}

void Scheduler::wait() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
}

SchedulerState Scheduler::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string Scheduler::lastError() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

size_t Scheduler::countWorkers(WorkerKind kind) const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    size_t count = 0;
    for (const auto& worker : workers_) {
        if (worker.kind == kind) {
            ++count;
        }
    }
    return count;
}

size_t Scheduler::activeDownloads() const {
    return countWorkers(WorkerKind::DOWNLOAD);
}

size_t Scheduler::activeUploads() const {
    return countWorkers(WorkerKind::UPLOAD);
}

void Scheduler::loop() {
    while (true) {
        tick();

        std::unique_lock<std::mutex> lock(state_mutex_);
        if (state_ == SchedulerState::IDLE) {
            break;
        }
        wake_.wait_for(lock, tick_interval_, [this] { return wake_requested_; });
        wake_requested_ = false;
    }
}

void Scheduler::tick() {
    SchedulerState current = state();
    if (current == SchedulerState::IDLE) {
        return;
    }

    if (current == SchedulerState::RUNNING) {
        try {
            if (store_.isStopRequested()) {
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    if (state_ == SchedulerState::RUNNING) {
                        state_ = SchedulerState::DRAINING;
                    }
                }
                logger_.info("Stop flag set, draining");
                cancelAll();
            } else {
                // Uploads first so finished downloads leave local storage sooner
                dispatchUploads();
                dispatchDownloads();
            }
        } catch (const std::exception& e) {
            recordFatal(e.what());
        }
    }

    reapFinished();

    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        active = workers_.size();
    }
    if (active > 0) {
        return;
    }

    current = state();
    if (current == SchedulerState::DRAINING) {
        finishRun("drained");
    } else if (current == SchedulerState::RUNNING &&
               store_.downloadQueue().empty() && store_.uploadQueue().empty()) {
        finishRun("all queues empty");
    }
}

void Scheduler::dispatchUploads() {
    while (countWorkers(WorkerKind::UPLOAD) < max_uploads_) {
        auto assignment = store_.dequeueUpload();
        if (!assignment) {
            break;
        }
        UploadAssignment job = *assignment;
        spawn(WorkerKind::UPLOAD, job.id,
              [this, job](const CancellationToken& cancel) { runUpload(job, cancel); });
    }
}

void Scheduler::dispatchDownloads() {
    while (countWorkers(WorkerKind::DOWNLOAD) < max_downloads_) {
        auto assignment = store_.dequeueDownload();
        if (!assignment) {
            break;
        }
        DownloadAssignment job = *assignment;
        spawn(WorkerKind::DOWNLOAD, job.id,
              [this, job](const CancellationToken& cancel) { runDownload(job, cancel); });
    }
}

void Scheduler::spawn(WorkerKind kind, const std::string& task_id,
                      std::function<void(const CancellationToken&)> body) {
    Worker worker;
    worker.task_id = task_id;
    worker.kind = kind;
    worker.cancel = std::make_shared<CancellationToken>();
    worker.done = std::make_shared<std::atomic<bool>>(false);

    auto cancel = worker.cancel;
    auto done = worker.done;
    worker.thread = std::thread([this, body, cancel, done, task_id]() {
        try {
            body(*cancel);
        } catch (const std::exception& e) {
            recordFatal("worker for " + task_id + ": " + e.what());
        }
        done->store(true);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            wake_requested_ = true;
        }
        wake_.notify_all();
    });

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(std::move(worker));
    }

    // A stop that raced with this dispatch must still reach the new worker
    if (state() != SchedulerState::RUNNING) {
        cancel->cancel();
    }
}

void Scheduler::reapFinished() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void Scheduler::runDownload(const DownloadAssignment& assignment,
                            const CancellationToken& cancel) {
    std::string dest_dir = download_dir_;
    std::string name;

    if (isPartialPath(assignment.local_path)) {
        fs::path partial(assignment.local_path);
        std::string file = partial.filename().string();
        name = file.substr(0, file.size() - std::strlen(kPartialSuffix));
        if (partial.has_parent_path()) {
            dest_dir = partial.parent_path().string();
        }
    } else {
        DiscoveredItem item;
        item.id = assignment.id;
        item.title = assignment.title;
        name = naming_.payloadFileName(item);
    }

    auto on_progress = [this, &assignment](const event::Transferring& ev) {
        try {
            store_.updateDownloadProgress(assignment.id, ev);
        } catch (const RelayqException& e) {
            recordFatal(e.what());
        }
    };

    FetchResult result = transfer_.fetch(assignment.source_ref, dest_dir, name,
                                         on_progress, cancel);

    ProgressEvent terminal;
    switch (result.outcome) {
        case FetchOutcome::COMPLETED:
            terminal = event::Finished{result.local_path};
            break;
        case FetchOutcome::CANCELLED:
            terminal = event::Paused{"download interrupted"};
            break;
        case FetchOutcome::FAILED:
            terminal = event::Failed{FailureKind::TRANSIENT, result.error};
            break;
    }

    store_.updateDownloadProgress(assignment.id, terminal);
}

void Scheduler::runUpload(const UploadAssignment& assignment,
                          const CancellationToken& cancel) {
    auto on_progress = [this, &assignment](const event::Transferring& ev) {
        try {
            store_.updateUploadProgress(assignment.id, ev);
        } catch (const RelayqException& e) {
            recordFatal(e.what());
        }
    };

    RelayResult result = relay_.relay(assignment.local_path, assignment.id,
                                      on_progress, cancel);

    ProgressEvent terminal;
    switch (result.outcome) {
        case RelayOutcome::UPLOADED:
            terminal = event::Finished{assignment.local_path};
            break;
        case RelayOutcome::SKIPPED_DUPLICATE:
            terminal = event::Skipped{"remote copy already present at " + result.remote_path};
            break;
        case RelayOutcome::SKIPPED_NOT_READY:
            terminal = event::Failed{FailureKind::CONTRACT_VIOLATION,
                                     "contract violation: " + result.error};
            break;
        case RelayOutcome::FAILED:
            terminal = event::Failed{FailureKind::TRANSIENT, result.error};
            break;
        case RelayOutcome::CANCELLED:
            terminal = event::Paused{"upload interrupted"};
            break;
    }

    bool applied = store_.updateUploadProgress(assignment.id, terminal);
    if (applied && result.ok() && delete_after_upload_) {
        store_.releaseLocalFile(assignment.id, true);
    }
}

void Scheduler::recordFatal(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (last_error_.empty()) {
            last_error_ = message;
        }
        if (state_ == SchedulerState::RUNNING) {
            state_ = SchedulerState::DRAINING;
        }
        wake_requested_ = true;
    }
    logger_.error("Fatal scheduler error, draining: " + message);
    wake_.notify_all();
    cancelAll();
}

void Scheduler::cancelAll() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& worker : workers_) {
        worker.cancel->cancel();
    }
}

void Scheduler::finishRun(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = SchedulerState::IDLE;
    }
    logger_.info("Scheduler run finished: " + reason);
}

} // namespace relayq
