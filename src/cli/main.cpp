/**
 * @file main.cpp
 * @brief relayq - download and relay orchestrator CLI entry point
 *
 * Commands:
 *   relayq run --items <manifest.json> [options]
 *   relayq status [-s] [--json] [--id <ID>]
 *   relayq resume
 *   relayq reset-failed
 *   relayq init [--reset]
 */

#include "relayq/config.h"
#include "relayq/errors.h"
#include "relayq/orchestrator.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace relayq {

// Version information
const char* VERSION = "1.0.0";

// Set by SIGINT/SIGTERM, polled by the run loop
static std::atomic<bool> g_interrupted{false};

static void signalHandler(int) {
    g_interrupted = true;
}

// ANSI color codes
namespace Color {
    // Check if output is a terminal
    inline bool isTerminal() {
        return isatty(fileno(stdout)) != 0;
    }

    inline std::string green() { return isTerminal() ? "\033[32m" : ""; }
    inline std::string yellow() { return isTerminal() ? "\033[33m" : ""; }
    inline std::string red() { return isTerminal() ? "\033[31m" : ""; }
    inline std::string cyan() { return isTerminal() ? "\033[36m" : ""; }
    inline std::string reset() { return isTerminal() ? "\033[0m" : ""; }
}

void printVersion() {
    std::cout << "relayq version " << VERSION << "\n"
              << "Resumable download and relay orchestrator\n";
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  run           Submit a manifest and run until all queues drain\n"
              << "  status        Show task state (-s: summary only, --json: raw JSON,\n"
              << "                --id <ID>: one task)\n"
              << "  resume        Requeue paused tasks\n"
              << "  reset-failed  Requeue failed tasks for a fresh download\n"
              << "  init          Create directories and write config.json\n"
              << "                (--reset also drops all task state)\n"
              << "\n"
              << "Run options:\n"
              << "  --items <file>       Discovery manifest (JSON array or {\"items\": [...]})\n"
              << "\n"
              << "Common options:\n"
              << "  --data <dir>         Data directory (default: ~/.relayq/<hostname>)\n"
              << "  --downloads <dir>    Local payload directory\n"
              << "  --remote <dir>       Mounted remote store root\n"
              << "  --log <dir>          Write logs to the specified directory\n"
              << "  --max-downloads N    Concurrent downloads (default: 8)\n"
              << "  --max-uploads N      Concurrent uploads (default: 8)\n"
              << "  --keep-local         Keep local files after upload\n"
              << "  --verbose            Echo log lines to stderr\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " init --remote /mnt/share\n"
              << "  " << program << " run --items batch.json --log ~/.relayq/logs\n"
              << "  " << program << " status -s\n"
              << "  " << program << " resume\n"
              << "  " << program << " --version\n";
}

// Value of "--name <value>", empty if absent
static std::string optionValue(int argc, char* argv[], const std::string& name) {
    for (int i = 2; i + 1 < argc; ++i) {
        if (argv[i] == name) {
            return argv[i + 1];
        }
    }
    return "";
}

static bool hasFlag(int argc, char* argv[], const std::string& name) {
    for (int i = 2; i < argc; ++i) {
        if (argv[i] == name) {
            return true;
        }
    }
    return false;
}

static std::string colorFor(TaskStatus status) {
    switch (status) {
        case TaskStatus::DOWNLOADING:
        case TaskStatus::UPLOADING:
            return Color::green();
        case TaskStatus::PENDING_DOWNLOAD:
        case TaskStatus::PENDING_UPLOAD:
        case TaskStatus::PAUSED:
            return Color::yellow();
        case TaskStatus::COMPLETED:
        case TaskStatus::SKIPPED_UPLOAD:
            return Color::cyan();
        default:
            return Color::red();
    }
}

static void printSummaryLine(const OrchestratorStatus& status) {
    size_t active = 0;
    size_t failed = 0;
    for (const auto& task : status.store.tasks) {
        if (task.status == TaskStatus::DOWNLOADING || task.status == TaskStatus::UPLOADING) {
            ++active;
        } else if (task.isFailed()) {
            ++failed;
        }
    }
    std::cout << "Total: " << status.store.tasks.size() << " tasks, "
              << Color::green() << active << " active" << Color::reset() << ", "
              << Color::yellow() << status.store.download_queue_count << " to download, "
              << status.store.upload_queue_count << " to upload" << Color::reset() << ", "
              << Color::cyan() << status.store.processed_count << " processed" << Color::reset()
              << ", " << Color::red() << failed << " failed" << Color::reset() << "\n";
}

// Write <data_dir>/YYYYMMDD_report.txt for a finished run
static std::string writeReport(const Config& config,
                               const SubmitSummary& submitted,
                               const ReconcileReport& reconciled,
                               const OrchestratorStatus& status,
                               bool clean) {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);

    std::ostringstream name;
    name << std::put_time(&tm_buf, "%Y%m%d") << "_report.txt";
    std::string path = config.data_dir + "/" + name.str();

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        throw RelayqException(ErrorCode::FILE_WRITE_ERROR, "Failed to open report: " + path);
    }

    out << "=== relayq run " << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << " ===\n"
        << "result: " << (clean ? "ok" : "failed: " + status.last_error) << "\n"
        << "submitted: queued " << submitted.queued
        << ", fast path " << submitted.fast_path
        << ", known " << submitted.already_known
        << ", processed " << submitted.already_processed
        << ", capped " << submitted.capped
        << ", invalid " << submitted.invalid << "\n"
        << "reconciled: " << reconciled.summary() << "\n"
        << "queues: download " << status.store.download_queue_count
        << ", upload " << status.store.upload_queue_count << "\n"
        << "workers: download " << status.active_downloads
        << ", upload " << status.active_uploads << "\n"
        << "processed: " << status.store.processed_count << "\n";

    for (const auto& task : status.store.tasks) {
        if (!task.isFinal()) {
            out << "  " << task.id << " " << taskStatusToString(task.status);
            if (!task.error_message.empty()) {
                out << " (" << task.error_message << ")";
            }
            out << "\n";
        }
    }
    out << "\n";

    if (out.fail()) {
        throw RelayqException(ErrorCode::FILE_WRITE_ERROR, "Failed to write report: " + path);
    }
    return path;
}

// Run command
int handleRun(int argc, char* argv[]) {
    std::string manifest = optionValue(argc, argv, "--items");
    if (manifest.empty()) {
        std::cerr << "Error: Missing --items <manifest.json>\n";
        return 1;
    }

    Config config = Config::fromArgs(argc, argv);
    std::vector<DiscoveredItem> items = Orchestrator::loadManifest(manifest);

    Orchestrator orchestrator(config);
    orchestrator.load();

    std::cout << "Starting relayq run...\n";
    std::cout << "  Data dir: " << config.data_dir << "\n";
    std::cout << "  Downloads: " << config.download_dir << "\n";
    std::cout << "  Remote: " << config.remote_root << "\n";
    if (config.enable_logging) {
        std::cout << "  Log dir: " << config.log_dir << "\n";
    }

    // Reconcile before submitting so adopted files are not fetched again
    orchestrator.getTaskStore().clearStop();
    ReconcileReport reconciled = orchestrator.reconcile();
    SubmitSummary submitted = orchestrator.submit(items);
    std::cout << "  Submitted " << items.size() << " items: "
              << submitted.queued << " queued, "
              << submitted.fast_path << " already downloaded, "
              << submitted.already_processed << " already processed\n";

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (!orchestrator.start()) {
        std::cerr << "Error: Failed to start the scheduler\n";
        return 1;
    }

    uint64_t seen = orchestrator.version();
    while (orchestrator.getScheduler().isRunning()) {
        if (g_interrupted) {
            std::cout << "Interrupted, pausing in-flight transfers...\n";
            orchestrator.stop();
            break;
        }
        orchestrator.waitForChange(seen, std::chrono::milliseconds(500));
        seen = orchestrator.version();
    }
    orchestrator.wait();

    OrchestratorStatus status = orchestrator.queryAllStatus();
    bool clean = status.last_error.empty();
    std::string report = writeReport(config, submitted, reconciled, status, clean);

    printSummaryLine(status);
    std::cout << "Report: " << report << "\n";
    if (!clean) {
        std::cerr << Color::red() << "Error: " << status.last_error << Color::reset() << "\n";
        return 1;
    }
    return 0;
}

// Status command
int handleStatus(int argc, char* argv[]) {
    Config config = Config::fromArgs(argc, argv);
    Orchestrator orchestrator(config);
    orchestrator.load();

    std::string id = optionValue(argc, argv, "--id");
    if (!id.empty()) {
        auto task = orchestrator.getTask(id);
        if (!task) {
            throw RelayqException(ErrorCode::TASK_NOT_FOUND, id);
        }
        std::cout << task->toJson() << "\n";
        return 0;
    }

    OrchestratorStatus status = orchestrator.queryAllStatus();

    if (hasFlag(argc, argv, "--json")) {
        std::cout << status.toJson() << "\n";
        return 0;
    }
    if (hasFlag(argc, argv, "-s") || hasFlag(argc, argv, "--summary")) {
        printSummaryLine(status);
        return 0;
    }

    std::cout << std::left
              << std::setw(22) << "ID"
              << std::setw(18) << "STATUS"
              << std::setw(10) << "PROGRESS"
              << "TITLE\n";
    std::cout << std::string(80, '-') << "\n";

    for (const auto& task : status.store.tasks) {
        std::ostringstream progress;
        progress << std::fixed << std::setprecision(1) << task.displayProgress() << "%";

        std::cout << std::left
                  << std::setw(22) << task.id
                  << colorFor(task.status) << std::setw(18) << taskStatusToString(task.status)
                  << Color::reset()
                  << std::setw(10) << progress.str()
                  << task.title << "\n";
        if (task.isFailed() && !task.error_message.empty()) {
            std::cout << "    " << Color::red() << task.error_message << Color::reset() << "\n";
        }
    }

    std::cout << "\n";
    printSummaryLine(status);
    return 0;
}

// Resume command
int handleResume(int argc, char* argv[]) {
    Config config = Config::fromArgs(argc, argv);
    Orchestrator orchestrator(config);
    orchestrator.load();

    size_t count = orchestrator.resume();
    std::cout << "Requeued " << count << " paused task(s)\n";
    return 0;
}

// Reset-failed command
int handleResetFailed(int argc, char* argv[]) {
    Config config = Config::fromArgs(argc, argv);
    Orchestrator orchestrator(config);
    orchestrator.load();

    size_t count = orchestrator.resetFailed();
    std::cout << "Reset " << count << " failed task(s)\n";
    return 0;
}

// Init command - create directories and persist the effective config
int handleInit(int argc, char* argv[]) {
    Config config = Config::fromArgs(argc, argv);

    std::cout << "Initializing relayq data...\n";
    std::cout << "  Data dir: " << config.data_dir << "\n";

    for (const auto& dir : {config.data_dir, config.download_dir}) {
        if (!Logger::createDirectory(dir)) {
            std::cerr << "Error: Failed to create " << dir << "\n";
            return 1;
        }
    }
    config.save();
    std::cout << "  Wrote: " << config.data_dir << "/config.json\n";

    if (hasFlag(argc, argv, "--reset")) {
        Orchestrator orchestrator(config);
        orchestrator.resetAll();
        std::cout << "  Task state cleared\n";
    }

    std::cout << "Initialization complete.\n";
    return 0;
}

int run(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    try {
        if (command == "run") {
            return handleRun(argc, argv);
        } else if (command == "status") {
            return handleStatus(argc, argv);
        } else if (command == "resume") {
            return handleResume(argc, argv);
        } else if (command == "reset-failed") {
            return handleResetFailed(argc, argv);
        } else if (command == "init") {
            return handleInit(argc, argv);
        } else if (command == "-h" || command == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (command == "-v" || command == "--version") {
            printVersion();
            return 0;
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            printUsage(argv[0]);
            return 1;
        }
    } catch (const RelayqException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace relayq

int main(int argc, char* argv[]) {
    return relayq::run(argc, argv);
}
