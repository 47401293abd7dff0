/**
 * @file test_relay_engine.cpp
 * @brief Unit tests for RelayEngine and FilesystemRemoteStore
 */

#include <gtest/gtest.h>
#include "relayq/relay_engine.h"
#include "relayq/filesystem_remote_store.h"
#include "test_fakes.h"

namespace relayq {
namespace testing {

namespace {
const std::string kKey = "ABC-XYZ-123";
const std::string kRemotePath = "ABC-XYZ-120/ABC-XYZ-123 Clip.mp4";
}

class RelayEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDir>("relay");
        local_path_ = dir_->sub("downloads/ABC-XYZ-123 Clip.mp4");
        engine_ = std::make_unique<RelayEngine>(remote_, logger_, 8, std::chrono::milliseconds(0));
    }

    RelayResult relay(const std::string& path) {
        return engine_->relay(path, kKey,
                              [this](const event::Transferring& ev) { events_.push_back(ev); },
                              cancel_);
    }

    Logger logger_;
    FakeRemoteStore remote_;
    CancellationToken cancel_;
    std::unique_ptr<TempDir> dir_;
    std::unique_ptr<RelayEngine> engine_;
    std::string local_path_;
    std::vector<event::Transferring> events_;
};

TEST_F(RelayEngineTest, UploadsIntoBucketDirectory) {
    std::string body = makePayload(50);
    writeFile(local_path_, body);

    RelayResult result = relay(local_path_);

    ASSERT_EQ(result.outcome, RelayOutcome::UPLOADED) << result.error;
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.skipped());
    EXPECT_EQ(result.remote_path, kRemotePath);
    EXPECT_EQ(result.bytes_sent, 50u);
    EXPECT_TRUE(remote_.hasDirectory("ABC-XYZ-120"));
    EXPECT_EQ(remote_.get(kRemotePath), body);

    // The local file is left for the caller to release
    EXPECT_EQ(readFile(local_path_), body);

    ASSERT_FALSE(events_.empty());
    EXPECT_EQ(events_.back().bytes_done, 50u);
    EXPECT_EQ(events_.back().bytes_total, 50u);
}

// A remote copy at least as large as the local file is kept
TEST_F(RelayEngineTest, ExistingRemoteCopySkips) {
    writeFile(local_path_, makePayload(500));
    remote_.put(kRemotePath, makePayload(500, 'A'));

    RelayResult result = relay(local_path_);

    EXPECT_EQ(result.outcome, RelayOutcome::SKIPPED_DUPLICATE);
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.skipped());
    EXPECT_EQ(result.bytes_sent, 0u);
    EXPECT_EQ(remote_.commits(), 0u);
    EXPECT_EQ(remote_.get(kRemotePath), makePayload(500, 'A'));
}

TEST_F(RelayEngineTest, SmallerRemoteCopyIsOverwritten) {
    std::string body = makePayload(40);
    writeFile(local_path_, body);
    remote_.put(kRemotePath, "stub");

    RelayResult result = relay(local_path_);

    EXPECT_EQ(result.outcome, RelayOutcome::UPLOADED);
    EXPECT_EQ(remote_.get(kRemotePath), body);
    EXPECT_EQ(remote_.commits(), 1u);
}

TEST_F(RelayEngineTest, MissingOrPartialFileIsNotReady) {
    RelayResult missing = relay(local_path_);
    EXPECT_EQ(missing.outcome, RelayOutcome::SKIPPED_NOT_READY);
    EXPECT_FALSE(missing.ok());
    EXPECT_TRUE(missing.skipped());

    std::string part = local_path_ + ".part";
    writeFile(part, "half");
    RelayResult partial = relay(part);
    EXPECT_EQ(partial.outcome, RelayOutcome::SKIPPED_NOT_READY);

    EXPECT_EQ(relay("").outcome, RelayOutcome::SKIPPED_NOT_READY);
    EXPECT_EQ(remote_.commits(), 0u);
}

TEST_F(RelayEngineTest, UnavailableRemoteFails) {
    writeFile(local_path_, makePayload(10));
    remote_.setAvailable(false);

    RelayResult result = relay(local_path_);

    EXPECT_EQ(result.outcome, RelayOutcome::FAILED);
    EXPECT_EQ(result.error_code, ErrorCode::RELAY_REMOTE_UNAVAILABLE);
    EXPECT_EQ(result.error, "share not mounted");
}

// A failed write never becomes visible remotely
TEST_F(RelayEngineTest, WriteFailureLeavesNothingRemote) {
    writeFile(local_path_, makePayload(10));
    remote_.setFailWrites(true);

    RelayResult result = relay(local_path_);

    EXPECT_EQ(result.outcome, RelayOutcome::FAILED);
    EXPECT_EQ(result.error_code, ErrorCode::RELAY_FAILED);
    EXPECT_FALSE(remote_.get(kRemotePath).has_value());
}

TEST_F(RelayEngineTest, CancelDiscardsUncommittedWrite) {
    writeFile(local_path_, makePayload(64));

    RelayResult result = engine_->relay(
        local_path_, kKey,
        [this](const event::Transferring& ev) {
            if (ev.bytes_done >= 16) {
                cancel_.cancel();
            }
        },
        cancel_);

    EXPECT_EQ(result.outcome, RelayOutcome::CANCELLED);
    EXPECT_EQ(result.error_code, ErrorCode::RELAY_CANCELLED);
    EXPECT_EQ(result.bytes_sent, 16u);
    EXPECT_FALSE(remote_.get(kRemotePath).has_value());
    EXPECT_TRUE(fileExists(local_path_));
}

// ========== FilesystemRemoteStore ==========

class FilesystemRemoteStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDir>("fs_remote");
        root_ = dir_->sub("share");
        std::filesystem::create_directories(root_);
        store_ = std::make_unique<FilesystemRemoteStore>(root_);
    }

    Logger logger_;
    std::unique_ptr<TempDir> dir_;
    std::string root_;
    std::unique_ptr<FilesystemRemoteStore> store_;
};

TEST_F(FilesystemRemoteStoreTest, RelayWritesUnderRoot) {
    std::string local = dir_->sub("downloads/ABC-XYZ-123 Clip.mp4");
    std::string body = makePayload(1000);
    writeFile(local, body);

    RelayEngine engine(*store_, logger_, 128, std::chrono::milliseconds(0));
    CancellationToken cancel;
    RelayResult result = engine.relay(local, kKey, nullptr, cancel);

    ASSERT_EQ(result.outcome, RelayOutcome::UPLOADED) << result.error;
    std::string remote_file = root_ + "/" + kRemotePath;
    EXPECT_EQ(readFile(remote_file), body);
    EXPECT_FALSE(fileExists(remote_file + ".relayq-tmp"));
    EXPECT_EQ(store_->stat(kRemotePath), std::optional<std::uint64_t>(1000));

    // Second relay sees the remote copy
    RelayResult again = engine.relay(local, kKey, nullptr, cancel);
    EXPECT_EQ(again.outcome, RelayOutcome::SKIPPED_DUPLICATE);
}

TEST_F(FilesystemRemoteStoreTest, StatMissingObject) {
    EXPECT_FALSE(store_->stat("nope/file.mp4").has_value());
}

TEST_F(FilesystemRemoteStoreTest, UncommittedWriterRemovesTempFile) {
    store_->ensureDirectory("bucket");
    {
        auto writer = store_->openWriter("bucket/obj.mp4");
        writer->write("abc", 3);
        EXPECT_TRUE(fileExists(root_ + "/bucket/obj.mp4.relayq-tmp"));
    }
    EXPECT_FALSE(fileExists(root_ + "/bucket/obj.mp4.relayq-tmp"));
    EXPECT_FALSE(fileExists(root_ + "/bucket/obj.mp4"));
}

TEST_F(FilesystemRemoteStoreTest, MissingRootIsUnavailable) {
    FilesystemRemoteStore unmounted(dir_->sub("not-mounted"));

    try {
        unmounted.stat("a/b.mp4");
        FAIL() << "expected RelayqException";
    } catch (const RelayqException& e) {
        EXPECT_EQ(e.code(), ErrorCode::RELAY_REMOTE_UNAVAILABLE);
    }
    EXPECT_THROW(unmounted.ensureDirectory("a"), RelayqException);
    EXPECT_THROW(unmounted.openWriter("a/b.mp4"), RelayqException);
}

TEST_F(FilesystemRemoteStoreTest, KeyClimbingOutOfRootFails) {
    std::string local = dir_->sub("downloads/clip.mp4");
    writeFile(local, makePayload(64));

    RelayEngine engine(*store_, logger_, 16, std::chrono::milliseconds(0));
    CancellationToken cancel;
    RelayResult result = engine.relay(local, "../../x-1", nullptr, cancel);

    EXPECT_EQ(result.outcome, RelayOutcome::FAILED);
    EXPECT_EQ(result.error_code, ErrorCode::RELAY_FAILED);
    std::filesystem::path outside =
        std::filesystem::path(root_).parent_path().parent_path() / "x-0";
    EXPECT_FALSE(std::filesystem::exists(outside));

    EXPECT_THROW(store_->stat("a/../../b.mp4"), RelayqException);
}

} // namespace testing
} // namespace relayq
