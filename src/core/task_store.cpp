/**
 * @file task_store.cpp
 * @brief Implementation of TaskStore class
 *
 * All transitions are applied to the in-memory state under mutex_, then the
 * whole snapshot is written to <state_file>.tmp and renamed over the state
 * file. If that write fails the in-memory state is rolled back so memory and
 * disk never disagree.
 */

#include "relayq/task_store.h"
#include "relayq/errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace relayq {

namespace fs = std::filesystem;

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::vector<std::string> toVector(const std::deque<std::string>& queue) {
    return std::vector<std::string>(queue.begin(), queue.end());
}

} // anonymous namespace

std::string StatusSnapshot::toJson() const {
    nlohmann::json j;

    nlohmann::json tasks_obj = nlohmann::json::object();
    for (const auto& task : tasks) {
        nlohmann::json tj = nlohmann::json::parse(task.toJson());
        tj["progress"] = task.displayProgress();
        tasks_obj[task.id] = tj;
    }
    j["tasks"] = tasks_obj;
    j["download_queue_count"] = download_queue_count;
    j["upload_queue_count"] = upload_queue_count;
    j["processed_count"] = processed_count;
    j["stop_requested"] = stop_requested;

    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

TaskStore::TaskStore(const std::string& state_file, Logger& logger)
    : state_file_(state_file), logger_(logger) {
}

// ========== Persistence ==========

std::string TaskStore::serializeLocked() const {
    nlohmann::json j;

    nlohmann::json tasks_obj = nlohmann::json::object();
    for (const auto& [id, task] : state_.tasks) {
        tasks_obj[id] = nlohmann::json::parse(task.toJson());
    }
    j["task_status"] = tasks_obj;
    j["download_queue"] = toVector(state_.download_queue);
    j["upload_queue"] = toVector(state_.upload_queue);
    j["processed_ids"] = std::vector<std::string>(state_.processed_ids.begin(),
                                                  state_.processed_ids.end());

    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

void TaskStore::persistLocked() const {
    if (state_file_.empty()) {
        return;
    }

    fs::path parent = fs::path(state_file_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw RelayqException(ErrorCode::FILE_WRITE_ERROR,
                                  "Cannot create state directory " + parent.string() +
                                  ": " + ec.message());
        }
    }

    std::string tmp_path = state_file_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw RelayqException(ErrorCode::FILE_WRITE_ERROR,
                                  "Cannot open " + tmp_path + " for writing");
        }
        file << serializeLocked();
        file.flush();
        if (!file) {
            throw RelayqException(ErrorCode::FILE_WRITE_ERROR,
                                  "Failed writing " + tmp_path);
        }
    }

    if (std::rename(tmp_path.c_str(), state_file_.c_str()) != 0) {
        int err = errno;
        std::remove(tmp_path.c_str());
        throw RelayqException(ErrorCode::FILE_WRITE_ERROR,
                              "Cannot replace " + state_file_ + ": " + std::strerror(err));
    }
}

void TaskStore::notifyLocked() {
    ++version_;
    changed_.notify_all();
}

void TaskStore::commitLocked(State backup) {
    try {
        persistLocked();
    } catch (const RelayqException& e) {
        state_ = std::move(backup);
        logger_.error("State persist failed, change rolled back: " + std::string(e.what()));
        throw;
    } catch (const std::exception& e) {
        state_ = std::move(backup);
        logger_.error("State persist failed, change rolled back: " + std::string(e.what()));
        throw RelayqException(ErrorCode::FILE_WRITE_ERROR,
                              "Cannot serialize state: " + std::string(e.what()));
    }
    notifyLocked();
}

void TaskStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    state_ = State();

    if (state_file_.empty()) {
        notifyLocked();
        return;
    }

    std::ifstream file(state_file_);
    if (!file.is_open()) {
        logger_.info("No state file at " + state_file_ + ", starting empty");
        notifyLocked();
        return;
    }

    try {
        std::stringstream buffer;
        buffer << file.rdbuf();
        file.close();

        nlohmann::json j = nlohmann::json::parse(buffer.str());

        State loaded;
        for (const auto& [id, task_json] : j.at("task_status").items()) {
            Task task = Task::fromJson(task_json.dump());
            if (task.id.empty()) {
                task.id = id;
            }
            loaded.tasks[id] = task;
        }
        for (const auto& id : j.value("download_queue", std::vector<std::string>())) {
            loaded.download_queue.push_back(id);
        }
        for (const auto& id : j.value("upload_queue", std::vector<std::string>())) {
            loaded.upload_queue.push_back(id);
        }
        for (const auto& id : j.value("processed_ids", std::vector<std::string>())) {
            loaded.processed_ids.insert(id);
        }
        state_ = std::move(loaded);

    } catch (const std::exception& e) {
        file.close();
        std::string corrupt_path = state_file_ + ".corrupt";
        logger_.error("State file " + state_file_ + " is unreadable (" + e.what() +
                      "), moving it to " + corrupt_path);
        if (std::rename(state_file_.c_str(), corrupt_path.c_str()) != 0) {
            logger_.error("Cannot move corrupt state file: " +
                          std::string(std::strerror(errno)));
        }
        state_ = State();
        notifyLocked();
        return;
    }

    validateLoadedLocked();

    logger_.info("Loaded " + std::to_string(state_.tasks.size()) + " tasks (" +
                 std::to_string(state_.download_queue.size()) + " pending download, " +
                 std::to_string(state_.upload_queue.size()) + " pending upload, " +
                 std::to_string(state_.processed_ids.size()) + " processed)");
    notifyLocked();
}

void TaskStore::validateLoadedLocked() {
    auto filterQueue = [this](std::deque<std::string>& queue, TaskStatus expected,
                              const char* name) {
        std::deque<std::string> kept;
        std::set<std::string> seen;
        for (const auto& id : queue) {
            auto it = state_.tasks.find(id);
            if (it == state_.tasks.end()) {
                logger_.warn(std::string("Dropping unknown id ") + id + " from " + name);
                continue;
            }
            if (it->second.status != expected) {
                logger_.warn(std::string("Dropping ") + id + " from " + name + ": status is " +
                             taskStatusToString(it->second.status));
                continue;
            }
            if (!seen.insert(id).second) {
                logger_.warn(std::string("Dropping duplicate ") + id + " from " + name);
                continue;
            }
            kept.push_back(id);
        }
        queue.swap(kept);
    };

    filterQueue(state_.download_queue, TaskStatus::PENDING_DOWNLOAD, "download queue");
    filterQueue(state_.upload_queue, TaskStatus::PENDING_UPLOAD, "upload queue");

    for (auto& [id, task] : state_.tasks) {
        if (task.status == TaskStatus::PENDING_DOWNLOAD && !contains(state_.download_queue, id)) {
            state_.download_queue.push_back(id);
        } else if (task.status == TaskStatus::PENDING_UPLOAD && !contains(state_.upload_queue, id)) {
            if (task.local_path.empty()) {
                logger_.warn("Task " + id + " is pending upload without a local path");
                task.status = TaskStatus::ERROR;
                task.error_message = "pending upload without a local path";
                continue;
            }
            state_.upload_queue.push_back(id);
        }

        if (task.isFinal()) {
            state_.processed_ids.insert(id);
        }
    }

    // The registry wins when it disagrees with the processed-set
    for (auto it = state_.processed_ids.begin(); it != state_.processed_ids.end();) {
        auto task_it = state_.tasks.find(*it);
        if (task_it != state_.tasks.end() && !task_it->second.isFinal()) {
            logger_.warn("Processed id " + *it + " has status " +
                         taskStatusToString(task_it->second.status) +
                         ", removing it from the processed set");
            it = state_.processed_ids.erase(it);
        } else {
            ++it;
        }
    }
}

// ========== Helpers ==========

void TaskStore::touch(Task& task) {
    task.last_updated = std::chrono::system_clock::now();
}

bool TaskStore::contains(const std::deque<std::string>& queue, const std::string& id) {
    return std::find(queue.begin(), queue.end(), id) != queue.end();
}

void TaskStore::removeFrom(std::deque<std::string>& queue, const std::string& id) {
    queue.erase(std::remove(queue.begin(), queue.end(), id), queue.end());
}

Task& TaskStore::createTaskLocked(const DiscoveredItem& item) {
    Task& task = state_.tasks[item.id];
    task = Task();
    task.id = item.id;
    task.title = item.title;
    task.source_ref = item.source_ref;
    task.metadata = item.metadata;
    touch(task);
    return task;
}

// ========== Discovery ==========

EnqueueResult TaskStore::enqueueDownload(const DiscoveredItem& item) {
    if (item.id.empty()) {
        logger_.warn("Rejecting item without an id: " + item.title);
        return EnqueueResult::INVALID;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (state_.processed_ids.count(item.id) > 0) {
        logger_.debug("Skipping processed item " + item.id);
        return EnqueueResult::ALREADY_PROCESSED;
    }

    auto it = state_.tasks.find(item.id);
    if (it != state_.tasks.end() && !it->second.isFailed()) {
        logger_.debug("Item " + item.id + " already known as " +
                      taskStatusToString(it->second.status));
        return EnqueueResult::ALREADY_ACTIVE;
    }

    State backup = state_;

    Task& task = createTaskLocked(item);
    task.status = TaskStatus::PENDING_DOWNLOAD;
    removeFrom(state_.upload_queue, item.id);
    if (!contains(state_.download_queue, item.id)) {
        state_.download_queue.push_back(item.id);
    }

    commitLocked(std::move(backup));
    logger_.info("Queued download " + item.id + " (" + item.title + ")");
    return EnqueueResult::QUEUED;
}

EnqueueResult TaskStore::markDownloadComplete(const DiscoveredItem& item,
                                              const std::string& local_path) {
    if (item.id.empty()) {
        logger_.warn("Rejecting item without an id: " + item.title);
        return EnqueueResult::INVALID;
    }
    if (local_path.empty() || isPartialPath(local_path)) {
        logger_.error("Refusing to mark " + item.id + " downloaded with path '" +
                      local_path + "'");
        return EnqueueResult::INVALID;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (state_.processed_ids.count(item.id) > 0) {
        logger_.debug("Skipping processed item " + item.id);
        return EnqueueResult::ALREADY_PROCESSED;
    }

    auto it = state_.tasks.find(item.id);
    if (it != state_.tasks.end()) {
        TaskStatus status = it->second.status;
        if (status == TaskStatus::DOWNLOADING ||
            status == TaskStatus::PENDING_UPLOAD ||
            status == TaskStatus::UPLOADING) {
            logger_.debug("Item " + item.id + " already in flight as " +
                          taskStatusToString(status));
            return EnqueueResult::ALREADY_ACTIVE;
        }
    }

    State backup = state_;

    Task* task = nullptr;
    if (it == state_.tasks.end()) {
        task = &createTaskLocked(item);
    } else {
        task = &it->second;
        touch(*task);
    }
    task->status = TaskStatus::PENDING_UPLOAD;
    task->download_progress = 100.0;
    task->upload_progress = 0.0;
    task->local_path = local_path;
    task->local_released = false;
    task->error_message.clear();

    removeFrom(state_.download_queue, item.id);
    if (!contains(state_.upload_queue, item.id)) {
        state_.upload_queue.push_back(item.id);
    }

    commitLocked(std::move(backup));
    logger_.info("Local file for " + item.id + " already complete, queued for upload");
    return EnqueueResult::QUEUED;
}

// ========== Download side ==========

std::optional<DownloadAssignment> TaskStore::dequeueDownload() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (stop_requested_ || state_.download_queue.empty()) {
        return std::nullopt;
    }

    State backup = state_;
    std::optional<DownloadAssignment> assignment;

    while (!state_.download_queue.empty() && !assignment) {
        std::string id = state_.download_queue.front();
        state_.download_queue.pop_front();

        auto it = state_.tasks.find(id);
        if (it == state_.tasks.end()) {
            logger_.warn("Download queue entry " + id + " has no task, discarding");
            continue;
        }
        Task& task = it->second;
        if (task.status != TaskStatus::PENDING_DOWNLOAD) {
            logger_.warn("Download queue entry " + id + " has status " +
                         taskStatusToString(task.status) + ", discarding");
            continue;
        }

        task.status = TaskStatus::DOWNLOADING;
        task.download_progress = 0.0;
        task.error_message.clear();
        touch(task);

        assignment = DownloadAssignment{task.id, task.title, task.source_ref, task.local_path};
    }

    commitLocked(std::move(backup));
    return assignment;
}

void TaskStore::applyDownloadEventLocked(Task& task, const ProgressEvent& ev) {
    auto finishWith = [this, &task](const std::string& path) {
        if (!path.empty()) {
            task.local_path = path;
        }
        if (task.local_path.empty() || isPartialPath(task.local_path)) {
            task.status = TaskStatus::ERROR;
            task.error_message = "download finished without a complete local file";
            logger_.error("Contract violation for " + task.id + ": " + task.error_message +
                          " (path '" + task.local_path + "')");
            return;
        }
        task.status = TaskStatus::PENDING_UPLOAD;
        task.download_progress = 100.0;
        task.upload_progress = 0.0;
        task.local_released = false;
        task.error_message.clear();
        removeFrom(state_.download_queue, task.id);
        if (!contains(state_.upload_queue, task.id)) {
            state_.upload_queue.push_back(task.id);
        }
        logger_.info("Downloaded " + task.id + " to " + task.local_path);
    };

    std::visit(Overloaded{
        [&task](const event::Transferring& e) {
            task.download_progress = percentOf(e.bytes_done, e.bytes_total);
        },
        [&finishWith](const event::Finished& e) {
            finishWith(e.local_path);
        },
        [this, &task](const event::Failed& e) {
            task.status = e.kind == FailureKind::TRANSIENT ? TaskStatus::FAILED_DOWNLOAD
                                                           : TaskStatus::ERROR;
            task.error_message = e.reason;
            logger_.error("Download of " + task.id + " failed: " + e.reason);
        },
        [this, &task](const event::Paused& e) {
            task.status = TaskStatus::PAUSED;
            task.error_message = e.reason;
            logger_.info("Download of " + task.id + " paused");
        },
        [this, &task, &finishWith](const event::Skipped& e) {
            logger_.info("Download of " + task.id + " skipped: " + e.reason);
            finishWith("");
        },
    }, ev);
}

bool TaskStore::updateDownloadProgress(const std::string& id, const ProgressEvent& ev) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = state_.tasks.find(id);
    if (it == state_.tasks.end()) {
        logger_.warn("Download progress for unknown task " + id);
        return false;
    }
    if (it->second.status != TaskStatus::DOWNLOADING) {
        logger_.debug("Ignoring download event for " + id + " in status " +
                      taskStatusToString(it->second.status));
        return false;
    }

    State backup = state_;
    Task& task = state_.tasks.at(id);
    applyDownloadEventLocked(task, ev);
    touch(task);
    commitLocked(std::move(backup));
    return true;
}

// ========== Upload side ==========

std::optional<UploadAssignment> TaskStore::dequeueUpload() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (stop_requested_ || state_.upload_queue.empty()) {
        return std::nullopt;
    }

    State backup = state_;
    std::optional<UploadAssignment> assignment;

    while (!state_.upload_queue.empty() && !assignment) {
        std::string id = state_.upload_queue.front();
        state_.upload_queue.pop_front();

        auto it = state_.tasks.find(id);
        if (it == state_.tasks.end()) {
            logger_.warn("Upload queue entry " + id + " has no task, discarding");
            continue;
        }
        Task& task = it->second;
        if (task.status != TaskStatus::PENDING_UPLOAD) {
            logger_.warn("Upload queue entry " + id + " has status " +
                         taskStatusToString(task.status) + ", discarding");
            continue;
        }
        if (task.local_path.empty()) {
            task.status = TaskStatus::ERROR;
            task.error_message = "pending upload without a local path";
            logger_.error("Contract violation for " + id + ": " + task.error_message);
            touch(task);
            continue;
        }

        task.status = TaskStatus::UPLOADING;
        task.upload_progress = 0.0;
        task.error_message.clear();
        touch(task);

        assignment = UploadAssignment{task.id, task.title, task.local_path};
    }

    commitLocked(std::move(backup));
    return assignment;
}

void TaskStore::applyUploadEventLocked(Task& task, const ProgressEvent& ev) {
    std::visit(Overloaded{
        [&task](const event::Transferring& e) {
            task.upload_progress = percentOf(e.bytes_done, e.bytes_total);
        },
        [this, &task](const event::Finished&) {
            task.status = TaskStatus::COMPLETED;
            task.upload_progress = 100.0;
            task.error_message.clear();
            state_.processed_ids.insert(task.id);
            logger_.info("Uploaded " + task.id);
        },
        [this, &task](const event::Failed& e) {
            task.status = e.kind == FailureKind::TRANSIENT ? TaskStatus::FAILED_UPLOAD
                                                           : TaskStatus::ERROR;
            task.error_message = e.reason;
            logger_.error("Upload of " + task.id + " failed: " + e.reason);
        },
        [this, &task](const event::Paused& e) {
            task.status = TaskStatus::PAUSED;
            task.error_message = e.reason;
            logger_.info("Upload of " + task.id + " paused");
        },
        [this, &task](const event::Skipped& e) {
            task.status = TaskStatus::SKIPPED_UPLOAD;
            task.upload_progress = 100.0;
            task.error_message = e.reason;
            state_.processed_ids.insert(task.id);
            logger_.info("Upload of " + task.id + " skipped: " + e.reason);
        },
    }, ev);
}

bool TaskStore::updateUploadProgress(const std::string& id, const ProgressEvent& ev) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = state_.tasks.find(id);
    if (it == state_.tasks.end()) {
        logger_.warn("Upload progress for unknown task " + id);
        return false;
    }
    if (it->second.status != TaskStatus::UPLOADING) {
        logger_.debug("Ignoring upload event for " + id + " in status " +
                      taskStatusToString(it->second.status));
        return false;
    }

    State backup = state_;
    Task& task = state_.tasks.at(id);
    applyUploadEventLocked(task, ev);
    touch(task);
    commitLocked(std::move(backup));
    return true;
}

bool TaskStore::releaseLocalFile(const std::string& id, bool delete_file) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = state_.tasks.find(id);
    if (it == state_.tasks.end() || !it->second.isFinal()) {
        return false;
    }
    if (it->second.local_released) {
        return true;
    }
    if (!delete_file || it->second.local_path.empty()) {
        return false;
    }

    State backup = state_;
    Task& task = state_.tasks.at(id);

    std::error_code ec;
    fs::remove(task.local_path, ec);
    if (ec) {
        logger_.error("Failed to delete local file " + task.local_path + ": " + ec.message());
        return false;
    }

    task.local_released = true;
    touch(task);
    commitLocked(std::move(backup));
    logger_.info("Deleted local file " + task.local_path);
    return true;
}

// ========== Recovery ==========

size_t TaskStore::resumePausedTasks() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> to_download;
    std::vector<std::string> to_upload;
    for (const auto& [id, task] : state_.tasks) {
        if (task.status != TaskStatus::PAUSED) {
            continue;
        }
        if (!task.local_path.empty() && !task.hasPartialPath() && !task.local_released) {
            to_upload.push_back(id);
        } else {
            to_download.push_back(id);
        }
    }

    if (to_download.empty() && to_upload.empty()) {
        return 0;
    }

    State backup = state_;

    for (auto it = to_download.rbegin(); it != to_download.rend(); ++it) {
        Task& task = state_.tasks.at(*it);
        task.status = TaskStatus::PENDING_DOWNLOAD;
        task.error_message.clear();
        touch(task);
        removeFrom(state_.download_queue, *it);
        removeFrom(state_.upload_queue, *it);
        state_.download_queue.push_front(*it);
    }
    for (auto it = to_upload.rbegin(); it != to_upload.rend(); ++it) {
        Task& task = state_.tasks.at(*it);
        task.status = TaskStatus::PENDING_UPLOAD;
        task.error_message.clear();
        touch(task);
        removeFrom(state_.download_queue, *it);
        removeFrom(state_.upload_queue, *it);
        state_.upload_queue.push_front(*it);
    }

    commitLocked(std::move(backup));

    size_t count = to_download.size() + to_upload.size();
    logger_.info("Resumed " + std::to_string(count) + " paused tasks (" +
                 std::to_string(to_download.size()) + " download, " +
                 std::to_string(to_upload.size()) + " upload)");
    return count;
}

size_t TaskStore::resetFailedTasks() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> failed;
    for (const auto& [id, task] : state_.tasks) {
        if (task.isFailed()) {
            failed.push_back(id);
        }
    }

    if (failed.empty()) {
        return 0;
    }

    State backup = state_;

    for (auto it = failed.rbegin(); it != failed.rend(); ++it) {
        Task& task = state_.tasks.at(*it);
        task.status = TaskStatus::PENDING_DOWNLOAD;
        task.download_progress = 0.0;
        task.upload_progress = 0.0;
        task.local_path.clear();
        task.local_released = false;
        task.error_message.clear();
        touch(task);

        state_.processed_ids.erase(*it);
        removeFrom(state_.download_queue, *it);
        removeFrom(state_.upload_queue, *it);
        state_.download_queue.push_front(*it);
    }

    commitLocked(std::move(backup));
    logger_.info("Reset " + std::to_string(failed.size()) + " failed tasks");
    return failed.size();
}

void TaskStore::resetAll() {
    std::lock_guard<std::mutex> lock(mutex_);

    State backup = state_;
    state_ = State();
    stop_requested_ = false;
    commitLocked(std::move(backup));
    logger_.warn("All task state cleared");
}

// ========== Reconciliation primitives ==========

bool TaskStore::adoptCompletedFile(const std::string& id, const std::string& path) {
    if (id.empty() || path.empty() || isPartialPath(path)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (state_.processed_ids.count(id) > 0) {
        return false;
    }

    auto it = state_.tasks.find(id);
    if (it != state_.tasks.end()) {
        TaskStatus status = it->second.status;
        if (status == TaskStatus::PENDING_UPLOAD || status == TaskStatus::UPLOADING ||
            it->second.isFinal()) {
            return false;
        }
    }

    State backup = state_;

    Task* task = nullptr;
    if (it == state_.tasks.end()) {
        DiscoveredItem item;
        item.id = id;
        item.title = fs::path(path).stem().string();
        task = &createTaskLocked(item);
    } else {
        task = &it->second;
        touch(*task);
    }
    task->status = TaskStatus::PENDING_UPLOAD;
    task->download_progress = 100.0;
    task->upload_progress = 0.0;
    task->local_path = path;
    task->local_released = false;
    task->error_message.clear();

    removeFrom(state_.download_queue, id);
    if (!contains(state_.upload_queue, id)) {
        state_.upload_queue.push_back(id);
    }

    commitLocked(std::move(backup));
    logger_.info("Adopted complete file " + path + " for " + id);
    return true;
}

PartialDisposition TaskStore::resumePartialFile(const std::string& id,
                                                const std::string& part_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = state_.tasks.find(id);
    if (it == state_.tasks.end()) {
        return PartialDisposition::NO_OWNER;
    }

    const Task& current = it->second;
    switch (current.status) {
        case TaskStatus::COMPLETED:
        case TaskStatus::SKIPPED_UPLOAD:
        case TaskStatus::PENDING_UPLOAD:
        case TaskStatus::UPLOADING:
            return PartialDisposition::ORPHANED;
        case TaskStatus::PAUSED:
            if (!current.local_path.empty() && !current.hasPartialPath()) {
                return PartialDisposition::ORPHANED;
            }
            break;
        case TaskStatus::FAILED_UPLOAD:
            return PartialDisposition::IGNORED;
        case TaskStatus::PENDING_DOWNLOAD:
        case TaskStatus::DOWNLOADING:
        case TaskStatus::ERROR:
        case TaskStatus::FAILED_DOWNLOAD:
            break;
    }

    State backup = state_;
    Task& task = state_.tasks.at(id);
    task.status = TaskStatus::PENDING_DOWNLOAD;
    task.local_path = part_path;
    task.error_message.clear();
    touch(task);

    removeFrom(state_.upload_queue, id);
    if (!contains(state_.download_queue, id)) {
        state_.download_queue.push_front(id);
    }

    commitLocked(std::move(backup));
    logger_.info("Resuming " + id + " from partial file " + part_path);
    return PartialDisposition::RESUMED;
}

MissingFileRepair TaskStore::repairMissingLocalFile(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = state_.tasks.find(id);
    if (it == state_.tasks.end()) {
        return MissingFileRepair::NONE;
    }

    TaskStatus status = it->second.status;
    State backup = state_;
    Task& task = state_.tasks.at(id);

    MissingFileRepair repair = MissingFileRepair::NONE;
    switch (status) {
        case TaskStatus::PENDING_UPLOAD:
        case TaskStatus::UPLOADING:
            task.status = TaskStatus::ERROR;
            task.error_message = "local file missing before upload: " + task.local_path;
            removeFrom(state_.upload_queue, id);
            repair = MissingFileRepair::MARKED_ERROR;
            break;
        case TaskStatus::PENDING_DOWNLOAD:
        case TaskStatus::DOWNLOADING:
        case TaskStatus::PAUSED:
            task.status = TaskStatus::PENDING_DOWNLOAD;
            task.download_progress = 0.0;
            task.upload_progress = 0.0;
            task.error_message = "local file missing, download restarted";
            task.local_path.clear();
            removeFrom(state_.upload_queue, id);
            if (!contains(state_.download_queue, id)) {
                state_.download_queue.push_front(id);
            }
            repair = MissingFileRepair::RESET_TO_DOWNLOAD;
            break;
        default:
            return MissingFileRepair::NONE;
    }
    touch(task);

    commitLocked(std::move(backup));
    logger_.warn("Local file for " + id + " is missing: " + task.error_message);
    return repair;
}

size_t TaskStore::requeueStaleInFlight() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> downloads;
    std::vector<std::string> uploads;
    for (const auto& [id, task] : state_.tasks) {
        if (task.status == TaskStatus::DOWNLOADING) {
            downloads.push_back(id);
        } else if (task.status == TaskStatus::UPLOADING) {
            uploads.push_back(id);
        }
    }

    if (downloads.empty() && uploads.empty()) {
        return 0;
    }

    State backup = state_;

    for (auto it = downloads.rbegin(); it != downloads.rend(); ++it) {
        Task& task = state_.tasks.at(*it);
        task.status = TaskStatus::PENDING_DOWNLOAD;
        touch(task);
        removeFrom(state_.download_queue, *it);
        state_.download_queue.push_front(*it);
    }
    for (auto it = uploads.rbegin(); it != uploads.rend(); ++it) {
        Task& task = state_.tasks.at(*it);
        task.status = TaskStatus::PENDING_UPLOAD;
        task.upload_progress = 0.0;
        touch(task);
        removeFrom(state_.upload_queue, *it);
        state_.upload_queue.push_front(*it);
    }

    commitLocked(std::move(backup));

    size_t count = downloads.size() + uploads.size();
    logger_.warn("Requeued " + std::to_string(count) + " interrupted tasks");
    return count;
}

// ========== Stop flag ==========

void TaskStore::requestStop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stop_requested_) {
        stop_requested_ = true;
        notifyLocked();
    }
}

void TaskStore::clearStop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_) {
        stop_requested_ = false;
        notifyLocked();
    }
}

bool TaskStore::isStopRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_requested_;
}

// ========== Queries ==========

std::optional<Task> TaskStore::getTask(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = state_.tasks.find(id);
    if (it != state_.tasks.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<Task> TaskStore::getAllTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Task> all;
    all.reserve(state_.tasks.size());
    for (const auto& [id, task] : state_.tasks) {
        all.push_back(task);
    }
    return all;
}

StatusSnapshot TaskStore::queryAllStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StatusSnapshot snapshot;
    snapshot.tasks.reserve(state_.tasks.size());
    for (const auto& [id, task] : state_.tasks) {
        snapshot.tasks.push_back(task);
    }
    snapshot.download_queue_count = state_.download_queue.size();
    snapshot.upload_queue_count = state_.upload_queue.size();
    snapshot.processed_count = state_.processed_ids.size();
    snapshot.stop_requested = stop_requested_;
    return snapshot;
}

std::set<std::string> TaskStore::getProcessedIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.processed_ids;
}

bool TaskStore::isProcessed(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.processed_ids.count(id) > 0;
}

std::vector<std::string> TaskStore::downloadQueue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return toVector(state_.download_queue);
}

std::vector<std::string> TaskStore::uploadQueue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return toVector(state_.upload_queue);
}

bool TaskStore::allUploadsCompletedLocked() const {
    if (!state_.upload_queue.empty()) {
        return false;
    }
    for (const auto& [id, task] : state_.tasks) {
        if (task.status == TaskStatus::UPLOADING) {
            return false;
        }
    }
    return true;
}

bool TaskStore::allUploadsCompleted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allUploadsCompletedLocked();
}

std::vector<std::string> TaskStore::checkInvariants() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> violations;

    auto checkQueue = [&](const std::deque<std::string>& queue, TaskStatus expected,
                          const std::string& name) {
        std::set<std::string> seen;
        for (const auto& id : queue) {
            if (!seen.insert(id).second) {
                violations.push_back(id + " appears twice in " + name);
            }
            auto it = state_.tasks.find(id);
            if (it == state_.tasks.end()) {
                violations.push_back(id + " in " + name + " has no task");
            } else if (it->second.status != expected) {
                violations.push_back(id + " in " + name + " has status " +
                                     taskStatusToString(it->second.status));
            }
        }
    };
    checkQueue(state_.download_queue, TaskStatus::PENDING_DOWNLOAD, "download queue");
    checkQueue(state_.upload_queue, TaskStatus::PENDING_UPLOAD, "upload queue");

    for (const auto& [id, task] : state_.tasks) {
        bool in_dq = contains(state_.download_queue, id);
        bool in_uq = contains(state_.upload_queue, id);
        if (in_dq && in_uq) {
            violations.push_back(id + " is in both queues");
        }
        if (task.status == TaskStatus::PENDING_DOWNLOAD && !in_dq) {
            violations.push_back(id + " is pending download but not queued");
        }
        if (task.status == TaskStatus::PENDING_UPLOAD && !in_uq) {
            violations.push_back(id + " is pending upload but not queued");
        }

        bool needs_path = task.status == TaskStatus::PENDING_UPLOAD ||
                          task.status == TaskStatus::UPLOADING ||
                          task.isFinal();
        if (needs_path && task.local_path.empty()) {
            violations.push_back(id + " has status " + taskStatusToString(task.status) +
                                 " without a local path");
        }
        if (needs_path && task.hasPartialPath()) {
            violations.push_back(id + " has status " + taskStatusToString(task.status) +
                                 " with a partial local path");
        }

        bool processed = state_.processed_ids.count(id) > 0;
        if (task.isFinal() && !processed) {
            violations.push_back(id + " is final but not processed");
        }
        if (processed && !task.isFinal()) {
            violations.push_back(id + " is processed but has status " +
                                 taskStatusToString(task.status));
        }
    }

    return violations;
}

// ========== Change notification ==========

uint64_t TaskStore::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

bool TaskStore::waitForChange(uint64_t seen_version, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return changed_.wait_for(lock, timeout, [&] { return version_ != seen_version; });
}

bool TaskStore::waitForAllUploads(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return changed_.wait_for(lock, timeout, [this] { return allUploadsCompletedLocked(); });
}

} // namespace relayq
