/**
 * @file reconciler.cpp
 * @brief Implementation of Reconciler
 */

#include "relayq/reconciler.h"
#include "relayq/task.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace relayq {

namespace fs = std::filesystem;

namespace {

std::string stripPartialSuffix(std::string name) {
    if (isPartialPath(name)) {
        name.resize(name.size() - std::string(kPartialSuffix).size());
    }
    return name;
}

} // anonymous namespace

std::string ReconcileReport::summary() const {
    std::ostringstream oss;
    oss << "adopted " << adopted_files
        << ", resumed " << resumed_partials
        << ", deleted partials " << deleted_partials
        << ", reset missing " << reset_missing
        << ", errored missing " << errored_missing
        << ", requeued stale " << requeued_stale;
    return oss.str();
}

Reconciler::Reconciler(TaskStore& store, ArtifactKeyFn key_of,
                       const std::string& payload_extension, Logger& logger,
                       ArtifactNameFn name_of)
    : store_(store),
      key_of_(std::move(key_of)),
      name_of_(std::move(name_of)),
      payload_extension_(payload_extension),
      logger_(logger) {
}

bool Reconciler::isPayload(const std::string& file_name) const {
    if (isPartialPath(file_name) || file_name.size() < payload_extension_.size()) {
        return false;
    }
    std::string tail = file_name.substr(file_name.size() - payload_extension_.size());
    return std::equal(tail.begin(), tail.end(), payload_extension_.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

std::map<std::string, std::string> Reconciler::knownArtifactNames() const {
    std::map<std::string, std::string> known;
    for (const auto& task : store_.getAllTasks()) {
        // Recorded paths win over names derived from titles
        if (!task.local_path.empty()) {
            known.emplace(stripPartialSuffix(fs::path(task.local_path).filename().string()),
                          task.id);
        }
    }
    if (name_of_) {
        for (const auto& task : store_.getAllTasks()) {
            known.emplace(name_of_(task), task.id);
        }
    }
    return known;
}

std::optional<std::string> Reconciler::ownerOf(
    const std::string& file_name,
    const std::map<std::string, std::string>& known) const {
    auto it = known.find(stripPartialSuffix(file_name));
    if (it != known.end()) {
        return it->second;
    }
    return key_of_(file_name);
}

bool Reconciler::deleteFile(const std::string& path, ReconcileReport& report) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        logger_.error("Failed to delete " + path + ": " + ec.message());
        return false;
    }
    report.deleted_paths.push_back(path);
    return true;
}

ReconcileReport Reconciler::reconcile(const std::string& download_dir) {
    ReconcileReport report;

    std::vector<std::string> files;
    std::error_code ec;
    if (!download_dir.empty() && fs::is_directory(download_dir, ec)) {
        for (const auto& entry : fs::directory_iterator(download_dir, ec)) {
            std::error_code entry_ec;
            if (entry.is_regular_file(entry_ec)) {
                files.push_back(entry.path().string());
            }
        }
        if (ec) {
            logger_.warn("Scanning " + download_dir + " stopped early: " + ec.message());
        }
        std::sort(files.begin(), files.end());
    } else {
        logger_.debug("Download directory " + download_dir + " not present, skipping file scan");
    }

    adoptCompletedFiles(files, report);
    reconcilePartials(files, report);
    repairMissingFiles(report);
    report.requeued_stale = store_.requeueStaleInFlight();

    logger_.info("Reconciliation finished: " + report.summary());
    return report;
}

void Reconciler::adoptCompletedFiles(const std::vector<std::string>& files,
                                     ReconcileReport& report) {
    auto known = knownArtifactNames();
    for (const auto& path : files) {
        std::string name = fs::path(path).filename().string();
        if (!isPayload(name)) {
            continue;
        }

        auto id = ownerOf(name, known);
        if (!id) {
            logger_.debug("No task id in payload name " + name + ", leaving it alone");
            continue;
        }

        if (store_.adoptCompletedFile(*id, path)) {
            ++report.adopted_files;
        }
    }
}

void Reconciler::reconcilePartials(const std::vector<std::string>& files,
                                   ReconcileReport& report) {
    auto known = knownArtifactNames();
    for (const auto& path : files) {
        if (!isPartialPath(path)) {
            continue;
        }
        std::string name = fs::path(path).filename().string();

        auto id = ownerOf(name, known);
        if (!id) {
            logger_.info("Deleting partial file with no derivable task id: " + path);
            if (deleteFile(path, report)) {
                ++report.deleted_partials;
            }
            continue;
        }

        switch (store_.resumePartialFile(*id, path)) {
            case PartialDisposition::RESUMED:
                ++report.resumed_partials;
                break;
            case PartialDisposition::ORPHANED:
                logger_.info("Deleting orphaned partial file of " + *id + ": " + path);
                if (deleteFile(path, report)) {
                    ++report.deleted_partials;
                }
                break;
            case PartialDisposition::NO_OWNER:
                logger_.info("Deleting partial file without a task: " + path);
                if (deleteFile(path, report)) {
                    ++report.deleted_partials;
                }
                break;
            case PartialDisposition::IGNORED:
                break;
        }
    }
}

void Reconciler::repairMissingFiles(ReconcileReport& report) {
    for (const auto& task : store_.getAllTasks()) {
        bool upload_side = task.status == TaskStatus::PENDING_UPLOAD ||
                           task.status == TaskStatus::UPLOADING;
        bool download_side = task.status == TaskStatus::PENDING_DOWNLOAD ||
                             task.status == TaskStatus::DOWNLOADING ||
                             task.status == TaskStatus::PAUSED;
        if (!upload_side && !download_side) {
            continue;
        }

        bool missing = false;
        if (task.local_path.empty()) {
            missing = upload_side;
        } else {
            std::error_code ec;
            missing = !fs::exists(task.local_path, ec);
        }
        if (!missing) {
            continue;
        }

        switch (store_.repairMissingLocalFile(task.id)) {
            case MissingFileRepair::RESET_TO_DOWNLOAD:
                ++report.reset_missing;
                break;
            case MissingFileRepair::MARKED_ERROR:
                ++report.errored_missing;
                break;
            case MissingFileRepair::NONE:
                break;
        }
    }
}

} // namespace relayq
