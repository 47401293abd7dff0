/**
 * @file filesystem_remote_store.cpp
 * @brief Implementation of FilesystemRemoteStore
 */

#include "relayq/filesystem_remote_store.h"
#include "relayq/errors.h"

#include <filesystem>
#include <fstream>

namespace relayq {

namespace fs = std::filesystem;

namespace {

class FileRemoteWriter : public RemoteWriter {
public:
    explicit FileRemoteWriter(const std::string& target_path)
        : target_path_(target_path), tmp_path_(target_path + ".relayq-tmp") {
        out_.open(tmp_path_, std::ios::binary | std::ios::trunc);
        if (!out_.is_open()) {
            throw RelayqException(ErrorCode::RELAY_FAILED,
                                  "Cannot open remote file " + tmp_path_);
        }
    }

    ~FileRemoteWriter() override {
        if (!committed_) {
            out_.close();
            std::error_code ec;
            fs::remove(tmp_path_, ec);
        }
    }

    void write(const char* data, std::size_t size) override {
        out_.write(data, static_cast<std::streamsize>(size));
        if (!out_) {
            throw RelayqException(ErrorCode::RELAY_FAILED,
                                  "Write to remote file " + tmp_path_ + " failed");
        }
    }

    void commit() override {
        out_.close();
        if (out_.fail()) {
            throw RelayqException(ErrorCode::RELAY_FAILED,
                                  "Closing remote file " + tmp_path_ + " failed");
        }
        std::error_code ec;
        fs::rename(tmp_path_, target_path_, ec);
        if (ec) {
            throw RelayqException(ErrorCode::RELAY_FAILED,
                                  "Cannot rename " + tmp_path_ + " to " + target_path_ +
                                  ": " + ec.message());
        }
        committed_ = true;
    }

private:
    std::string target_path_;
    std::string tmp_path_;
    std::ofstream out_;
    bool committed_ = false;
};

} // anonymous namespace

FilesystemRemoteStore::FilesystemRemoteStore(const std::string& root)
    : root_(root) {
}

void FilesystemRemoteStore::requireRoot() const {
    std::error_code ec;
    if (root_.empty() || !fs::is_directory(root_, ec)) {
        throw RelayqException(ErrorCode::RELAY_REMOTE_UNAVAILABLE,
                              "Remote root not available: " + root_);
    }
}

std::string FilesystemRemoteStore::resolve(const std::string& remote_path) const {
    fs::path relative = fs::path(remote_path).relative_path();
    for (const auto& component : relative) {
        if (component == "..") {
            throw RelayqException(ErrorCode::RELAY_FAILED,
                                  "Remote path escapes the share root: " + remote_path);
        }
    }
    return (fs::path(root_) / relative).string();
}

std::optional<std::uint64_t> FilesystemRemoteStore::stat(const std::string& remote_path) {
    requireRoot();

    std::error_code ec;
    std::string path = resolve(remote_path);
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::uint64_t size = fs::file_size(path, ec);
    if (ec) {
        throw RelayqException(ErrorCode::RELAY_FAILED,
                              "Cannot stat remote file " + path + ": " + ec.message());
    }
    return size;
}

void FilesystemRemoteStore::ensureDirectory(const std::string& remote_dir) {
    requireRoot();

    std::error_code ec;
    std::string path = resolve(remote_dir);
    fs::create_directories(path, ec);
    if (ec) {
        throw RelayqException(ErrorCode::RELAY_FAILED,
                              "Cannot create remote directory " + path + ": " + ec.message());
    }
}

std::unique_ptr<RemoteWriter> FilesystemRemoteStore::openWriter(const std::string& remote_path) {
    requireRoot();
    return std::make_unique<FileRemoteWriter>(resolve(remote_path));
}

} // namespace relayq
