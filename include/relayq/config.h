/**
 * @file config.h
 * @brief Configuration management for relayq
 *
 * Defines the Config struct which holds all configuration parameters
 * for the relayq system, including pool sizes, paths, transfer tuning
 * and command-line argument parsing.
 */

#ifndef RELAYQ_CONFIG_H
#define RELAYQ_CONFIG_H

#include <cstddef>
#include <string>

namespace relayq {

/**
 * @brief Configuration parameters for relayq system
 *
 * Contains all configurable parameters including:
 * - Worker pool bounds and queue cap
 * - Scheduling and progress intervals
 * - Transfer tuning (chunk sizes, user agent, timeouts)
 * - File paths (data directory, downloads, remote root, logs)
 *
 * Configuration can be loaded from command-line arguments using fromArgs().
 */
struct Config {
    // ========== Worker Pools ==========

    /// Maximum number of concurrent download workers.
    /// Default: 8
    /// Can be set via --max-downloads command-line argument
    int max_concurrent_downloads = 8;

    /// Maximum number of concurrent upload workers.
    /// Default: 8
    /// Can be set via --max-uploads command-line argument
    int max_concurrent_uploads = 8;

    /// Cap on the download queue length accepted per discovery batch.
    /// Default: 20
    int max_queue_size = 20;

    // ========== Scheduling Parameters ==========

    /// Interval in milliseconds between scheduler ticks.
    /// Default: 1000 ms (1 second)
    int tick_interval_ms = 1000;

    /// Minimum interval in milliseconds between progress reports.
    /// Default: 500 ms
    int progress_interval_ms = 500;

    // ========== Transfer Tuning ==========

    /// Download buffer size hint in bytes.
    /// Default: 8192
    size_t download_chunk_size = 8192;

    /// Relay copy chunk in bytes.
    /// Default: 1 MiB
    size_t relay_chunk_size = 1024 * 1024;

    /// Delete the local payload after a successful relay.
    /// Cleared by --keep-local
    bool delete_after_upload = true;

    /// HTTP User-Agent header.
    std::string user_agent = "relayq/1.0";

    /// Transport connect timeout in seconds.
    long connect_timeout_s = 30;

    // ========== Naming ==========

    /// Extension of completed payload files.
    std::string payload_extension = ".mp4";

    /// Regex used to derive a TaskID from a payload filename.
    std::string id_pattern = "[A-Za-z0-9]+-[A-Za-z]+-[0-9]+";

    // ========== Paths ==========

    /// Directory for persistent data storage.
    /// Format: ~/.relayq/<hostname>/
    std::string data_dir;

    /// Snapshot file name inside data_dir.
    std::string state_file = "task_status.json";

    /// Directory for local payload files.
    /// Default: <data_dir>/downloads
    std::string download_dir;

    /// Root of the mounted remote store.
    /// Default: <data_dir>/remote
    std::string remote_root;

    /// Directory for log files (empty if logging disabled).
    /// Set via --log command-line argument
    std::string log_dir;

    // ========== Logging ==========

    /// Whether logging is enabled.
    /// Set to true when --log argument is provided
    bool enable_logging = false;

    /// Echo log lines to stderr (foreground CLI runs, not persisted).
    /// Set via --verbose
    bool log_to_stderr = false;

    // ========== Methods ==========

    /**
     * @brief Parse configuration from command-line arguments
     *
     * Supported arguments:
     * - --data <dir>: Set data directory
     * - --downloads <dir>: Set download directory
     * - --remote <dir>: Set remote store root
     * - --log <dir>: Enable logging and set log directory
     * - --max-downloads <N>, --max-uploads <N>: Pool bounds
     * - --keep-local: Keep local files after upload
     * - --verbose: Echo log lines to stderr
     *
     * Paths not given default to ~/.relayq/<hostname>/ and its
     * downloads/ and remote/ subdirectories. If <data_dir>/config.json
     * exists it is loaded first and flags override it.
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return Configured Config object
     */
    static Config fromArgs(int argc, char* argv[]);

    /**
     * @brief Serialize configuration to JSON string
     * @return JSON string representation
     */
    std::string toJson() const;

    /**
     * @brief Deserialize configuration from JSON string
     * @param json JSON string to parse
     * @return Config object
     * @throws RelayqException if JSON is invalid
     */
    static Config fromJson(const std::string& json);

    /**
     * @brief Save configuration to data_dir/config.json
     * @throws RelayqException if the file cannot be written
     */
    void save() const;

    /**
     * @brief Load configuration from data_dir/config.json
     * @param data_dir Directory containing config.json
     * @return Config object (defaults if file doesn't exist)
     */
    static Config load(const std::string& data_dir);

    /**
     * @brief Full path of the snapshot file
     */
    std::string stateFilePath() const;

    /**
     * @brief Fill empty download_dir/remote_root from data_dir
     */
    void applyDerivedPaths();

    bool operator==(const Config& other) const;

    bool operator!=(const Config& other) const {
        return !(*this == other);
    }

    /**
     * @brief Default data directory: ~/.relayq/<hostname>
     */
    static std::string defaultDataDir();

private:
    /**
     * @brief Get current hostname
     * @return Hostname string
     */
    static std::string getHostname();

    /**
     * @brief Get user's home directory
     * @return Home directory path
     */
    static std::string getHomeDir();
};

} // namespace relayq

#endif // RELAYQ_CONFIG_H
