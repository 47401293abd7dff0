/**
 * @file config.cpp
 * @brief Implementation of Config class
 *
 * Handles command-line argument parsing, JSON serialization,
 * and automatic path detection based on system environment.
 */

#include "relayq/config.h"
#include "relayq/errors.h"
#include "relayq/logger.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace relayq {

/**
 * @brief Expand ~ to home directory in path
 * @param path Path that may contain ~
 * @return Expanded path
 */
static std::string expandPath(const std::string& path) {
    if (path.empty()) {
        return path;
    }
    if (path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home != nullptr && home[0] != '\0') {
            return std::string(home) + path.substr(1);
        }
        struct passwd* pw = getpwuid(getuid());
        if (pw != nullptr && pw->pw_dir != nullptr) {
            return std::string(pw->pw_dir) + path.substr(1);
        }
    }
    return path;
}

std::string Config::getHostname() {
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        return std::string(hostname);
    }
    return "localhost";
}

std::string Config::getHomeDir() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return std::string(home);
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return std::string(pw->pw_dir);
    }

    return "/tmp";
}

std::string Config::defaultDataDir() {
    return getHomeDir() + "/.relayq/" + getHostname();
}

void Config::applyDerivedPaths() {
    if (data_dir.empty()) {
        data_dir = defaultDataDir();
    }
    if (download_dir.empty()) {
        download_dir = data_dir + "/downloads";
    }
    if (remote_root.empty()) {
        remote_root = data_dir + "/remote";
    }
}

std::string Config::stateFilePath() const {
    if (data_dir.empty()) {
        return "";
    }
    return data_dir + "/" + state_file;
}

Config Config::fromArgs(int argc, char* argv[]) {
    // --data decides where config.json lives, so it is read first
    std::string data_dir;
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--data") {
            data_dir = expandPath(argv[i + 1]);
        }
    }
    if (data_dir.empty()) {
        data_dir = defaultDataDir();
    }

    Config config = load(data_dir);
    config.data_dir = data_dir;

    auto parseInt = [](const char* value, int fallback) {
        try {
            int parsed = std::stoi(value);
            return parsed > 0 ? parsed : fallback;
        } catch (const std::exception&) {
            return fallback;
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--data" && i + 1 < argc) {
            ++i;
        } else if (arg == "--downloads" && i + 1 < argc) {
            config.download_dir = expandPath(argv[++i]);
        } else if (arg == "--remote" && i + 1 < argc) {
            config.remote_root = expandPath(argv[++i]);
        } else if (arg == "--log" && i + 1 < argc) {
            config.enable_logging = true;
            config.log_dir = expandPath(argv[++i]);
        } else if (arg == "--max-downloads" && i + 1 < argc) {
            config.max_concurrent_downloads = parseInt(argv[++i], config.max_concurrent_downloads);
        } else if (arg == "--max-uploads" && i + 1 < argc) {
            config.max_concurrent_uploads = parseInt(argv[++i], config.max_concurrent_uploads);
        } else if (arg == "--keep-local") {
            config.delete_after_upload = false;
        } else if (arg == "--verbose") {
            config.log_to_stderr = true;
        }
        // Other arguments are ignored (handled by CLI)
    }

    config.applyDerivedPaths();
    return config;
}

std::string Config::toJson() const {
    nlohmann::json j;

    // Worker pools
    j["max_concurrent_downloads"] = max_concurrent_downloads;
    j["max_concurrent_uploads"] = max_concurrent_uploads;
    j["max_queue_size"] = max_queue_size;

    // Scheduling parameters
    j["tick_interval_ms"] = tick_interval_ms;
    j["progress_interval_ms"] = progress_interval_ms;

    // Transfer tuning
    j["download_chunk_size"] = download_chunk_size;
    j["relay_chunk_size"] = relay_chunk_size;
    j["delete_after_upload"] = delete_after_upload;
    j["user_agent"] = user_agent;
    j["connect_timeout_s"] = connect_timeout_s;

    // Naming
    j["payload_extension"] = payload_extension;
    j["id_pattern"] = id_pattern;

    // Paths
    j["data_dir"] = data_dir;
    j["state_file"] = state_file;
    j["download_dir"] = download_dir;
    j["remote_root"] = remote_root;
    j["log_dir"] = log_dir;

    // Logging
    j["enable_logging"] = enable_logging;

    return j.dump(2);
}

Config Config::fromJson(const std::string& json) {
    try {
        nlohmann::json j = nlohmann::json::parse(json);

        Config config;

        config.max_concurrent_downloads =
            j.value("max_concurrent_downloads", config.max_concurrent_downloads);
        config.max_concurrent_uploads =
            j.value("max_concurrent_uploads", config.max_concurrent_uploads);
        config.max_queue_size = j.value("max_queue_size", config.max_queue_size);

        config.tick_interval_ms = j.value("tick_interval_ms", config.tick_interval_ms);
        config.progress_interval_ms = j.value("progress_interval_ms", config.progress_interval_ms);

        config.download_chunk_size = j.value("download_chunk_size", config.download_chunk_size);
        config.relay_chunk_size = j.value("relay_chunk_size", config.relay_chunk_size);
        config.delete_after_upload = j.value("delete_after_upload", config.delete_after_upload);
        config.user_agent = j.value("user_agent", config.user_agent);
        config.connect_timeout_s = j.value("connect_timeout_s", config.connect_timeout_s);

        config.payload_extension = j.value("payload_extension", config.payload_extension);
        config.id_pattern = j.value("id_pattern", config.id_pattern);

        config.data_dir = j.value("data_dir", config.data_dir);
        config.state_file = j.value("state_file", config.state_file);
        config.download_dir = j.value("download_dir", config.download_dir);
        config.remote_root = j.value("remote_root", config.remote_root);
        config.log_dir = j.value("log_dir", config.log_dir);

        config.enable_logging = j.value("enable_logging", config.enable_logging);

        return config;

    } catch (const nlohmann::json::exception& e) {
        throw RelayqException(ErrorCode::FILE_PARSE_ERROR,
                              std::string("Config JSON parse error: ") + e.what());
    }
}

void Config::save() const {
    if (data_dir.empty()) {
        throw RelayqException(ErrorCode::FILE_WRITE_ERROR, "Data directory not set");
    }

    if (!Logger::createDirectory(data_dir)) {
        throw RelayqException(ErrorCode::FILE_WRITE_ERROR,
                              "Failed to create data directory: " + data_dir);
    }

    std::string config_path = data_dir + "/config.json";
    std::ofstream file(config_path);

    if (!file.is_open()) {
        throw RelayqException(ErrorCode::FILE_WRITE_ERROR,
                              "Failed to open config file for writing: " + config_path);
    }

    file << toJson();

    if (file.fail()) {
        throw RelayqException(ErrorCode::FILE_WRITE_ERROR,
                              "Failed to write config file: " + config_path);
    }
}

Config Config::load(const std::string& data_dir) {
    std::string config_path = data_dir + "/config.json";
    std::ifstream file(config_path);

    if (!file.is_open()) {
        Config config;
        config.data_dir = data_dir;
        config.applyDerivedPaths();
        return config;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    if (file.fail() && !file.eof()) {
        throw RelayqException(ErrorCode::FILE_READ_ERROR,
                              "Failed to read config file: " + config_path);
    }

    Config config = fromJson(content);
    if (config.data_dir.empty()) {
        config.data_dir = data_dir;
    }
    config.applyDerivedPaths();
    return config;
}

bool Config::operator==(const Config& other) const {
    return max_concurrent_downloads == other.max_concurrent_downloads &&
           max_concurrent_uploads == other.max_concurrent_uploads &&
           max_queue_size == other.max_queue_size &&
           tick_interval_ms == other.tick_interval_ms &&
           progress_interval_ms == other.progress_interval_ms &&
           download_chunk_size == other.download_chunk_size &&
           relay_chunk_size == other.relay_chunk_size &&
           delete_after_upload == other.delete_after_upload &&
           user_agent == other.user_agent &&
           connect_timeout_s == other.connect_timeout_s &&
           payload_extension == other.payload_extension &&
           id_pattern == other.id_pattern &&
           data_dir == other.data_dir &&
           state_file == other.state_file &&
           download_dir == other.download_dir &&
           remote_root == other.remote_root &&
           log_dir == other.log_dir &&
           enable_logging == other.enable_logging;
}

} // namespace relayq
