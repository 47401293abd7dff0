/**
 * @file task.cpp
 * @brief Implementation of Task JSON serialization/deserialization
 *
 * Uses nlohmann/json library for JSON handling.
 */

#include "relayq/task.h"
#include "relayq/errors.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <sstream>

namespace relayq {

namespace {

/**
 * @brief Convert time_point to ISO 8601 string
 * @param tp Time point to convert
 * @return ISO 8601 formatted string (e.g., "2024-01-15T10:30:00Z")
 */
std::string timePointToString(const std::chrono::system_clock::time_point& tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val;
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

/**
 * @brief Parse ISO 8601 string to time_point
 * @param str ISO 8601 formatted string
 * @return Parsed time_point
 * @throws std::runtime_error if parsing fails
 */
std::chrono::system_clock::time_point stringToTimePoint(const std::string& str) {
    std::tm tm_val = {};
    std::istringstream iss(str);
    iss >> std::get_time(&tm_val, "%Y-%m-%dT%H:%M:%SZ");

    if (iss.fail()) {
        throw std::runtime_error("Failed to parse time string: " + str);
    }

    time_t time_t_val = timegm(&tm_val);
    return std::chrono::system_clock::from_time_t(time_t_val);
}

} // anonymous namespace

bool isPartialPath(const std::string& path) {
    const std::string suffix = kPartialSuffix;
    return path.size() >= suffix.size() &&
           path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool Task::hasPartialPath() const {
    return isPartialPath(local_path);
}

double Task::displayProgress() const {
    switch (status) {
        case TaskStatus::DOWNLOADING:
            return download_progress;
        case TaskStatus::UPLOADING:
            return upload_progress;
        case TaskStatus::COMPLETED:
        case TaskStatus::SKIPPED_UPLOAD:
            return 100.0;
        default:
            return 0.0;
    }
}

std::string Task::toJson() const {
    nlohmann::json j;

    j["id"] = id;
    j["title"] = title;
    j["source_ref"] = source_ref;
    j["metadata"] = metadata;

    j["status"] = taskStatusToString(status);
    j["download_progress"] = download_progress;
    j["upload_progress"] = upload_progress;

    // Empty local path is stored as null
    if (local_path.empty()) {
        j["local_path"] = nullptr;
    } else {
        j["local_path"] = local_path;
    }
    j["local_released"] = local_released;

    if (error_message.empty()) {
        j["error_message"] = nullptr;
    } else {
        j["error_message"] = error_message;
    }

    j["last_updated"] = timePointToString(last_updated);

    // Titles derived from filenames may carry invalid UTF-8
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Task Task::fromJson(const std::string& json) {
    try {
        nlohmann::json j = nlohmann::json::parse(json);

        Task task;

        task.id = j.at("id").get<std::string>();
        task.title = j.value("title", "");
        task.source_ref = j.value("source_ref", "");
        if (j.contains("metadata") && j["metadata"].is_object()) {
            task.metadata = j["metadata"].get<std::map<std::string, std::string>>();
        }

        task.status = taskStatusFromString(j.at("status").get<std::string>());
        task.download_progress = j.value("download_progress", 0.0);
        task.upload_progress = j.value("upload_progress", 0.0);

        if (j.contains("local_path") && !j["local_path"].is_null()) {
            task.local_path = j["local_path"].get<std::string>();
        }
        task.local_released = j.value("local_released", false);

        if (j.contains("error_message") && !j["error_message"].is_null()) {
            task.error_message = j["error_message"].get<std::string>();
        }

        if (j.contains("last_updated") && !j["last_updated"].is_null()) {
            task.last_updated = stringToTimePoint(j["last_updated"].get<std::string>());
        }

        return task;

    } catch (const nlohmann::json::exception& e) {
        throw RelayqException(ErrorCode::FILE_PARSE_ERROR,
                              std::string("JSON parse error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw RelayqException(ErrorCode::FILE_PARSE_ERROR, e.what());
    } catch (const std::runtime_error& e) {
        throw RelayqException(ErrorCode::FILE_PARSE_ERROR, e.what());
    }
}

bool Task::operator==(const Task& other) const {
    if (id != other.id) return false;
    if (title != other.title) return false;
    if (source_ref != other.source_ref) return false;
    if (metadata != other.metadata) return false;

    if (status != other.status) return false;
    if (download_progress != other.download_progress) return false;
    if (upload_progress != other.upload_progress) return false;
    if (local_path != other.local_path) return false;
    if (local_released != other.local_released) return false;
    if (error_message != other.error_message) return false;

    // Timestamps compare with second precision due to serialization
    auto toSeconds = [](const std::chrono::system_clock::time_point& tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(
            tp.time_since_epoch()).count();
    };

    return toSeconds(last_updated) == toSeconds(other.last_updated);
}

} // namespace relayq
