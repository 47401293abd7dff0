/**
 * @file test_config.cpp
 * @brief Unit tests for Config class
 *
 * Tests command-line argument parsing, JSON serialization/deserialization,
 * config.json persistence and path derivation.
 */

#include "relayq/config.h"
#include "relayq/errors.h"
#include "test_fakes.h"

#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>

namespace relayq {
namespace {

using testing::TempDir;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Point HOME at a scratch directory so a real ~/.relayq is never read
        const char* home = std::getenv("HOME");
        original_home_ = home ? home : "";
        home_ = std::make_unique<TempDir>("config_home");
        setenv("HOME", home_->path().c_str(), 1);
    }

    void TearDown() override {
        if (!original_home_.empty()) {
            setenv("HOME", original_home_.c_str(), 1);
        } else {
            unsetenv("HOME");
        }
        home_.reset();
    }

    std::string original_home_;
    std::unique_ptr<TempDir> home_;
};

// ========== Default Values Tests ==========

TEST_F(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.max_concurrent_downloads, 8);
    EXPECT_EQ(config.max_concurrent_uploads, 8);
    EXPECT_EQ(config.max_queue_size, 20);
    EXPECT_EQ(config.tick_interval_ms, 1000);
    EXPECT_EQ(config.progress_interval_ms, 500);
    EXPECT_EQ(config.download_chunk_size, 8192u);
    EXPECT_EQ(config.relay_chunk_size, 1024u * 1024u);
    EXPECT_TRUE(config.delete_after_upload);
    EXPECT_EQ(config.payload_extension, ".mp4");
    EXPECT_EQ(config.state_file, "task_status.json");

    // Logging
    EXPECT_FALSE(config.enable_logging);
    EXPECT_FALSE(config.log_to_stderr);
    EXPECT_TRUE(config.log_dir.empty());
}

// ========== Command-line Argument Parsing Tests ==========

TEST_F(ConfigTest, FromArgsNoArguments) {
    char* argv[] = {const_cast<char*>("relayq")};
    Config config = Config::fromArgs(1, argv);

    EXPECT_EQ(config.max_concurrent_downloads, 8);
    EXPECT_FALSE(config.enable_logging);

    // Paths derived from ~/.relayq/<hostname>
    EXPECT_EQ(config.data_dir.find(home_->path() + "/.relayq/"), 0u);
    EXPECT_EQ(config.download_dir, config.data_dir + "/downloads");
    EXPECT_EQ(config.remote_root, config.data_dir + "/remote");
    EXPECT_EQ(config.stateFilePath(), config.data_dir + "/task_status.json");
}

TEST_F(ConfigTest, FromArgsWithAllOptions) {
    char* argv[] = {
        const_cast<char*>("relayq"),
        const_cast<char*>("run"),
        const_cast<char*>("--data"),
        const_cast<char*>("/srv/relayq"),
        const_cast<char*>("--downloads"),
        const_cast<char*>("/scratch/dl"),
        const_cast<char*>("--remote"),
        const_cast<char*>("/mnt/share"),
        const_cast<char*>("--log"),
        const_cast<char*>("/tmp/logs"),
        const_cast<char*>("--max-downloads"),
        const_cast<char*>("3"),
        const_cast<char*>("--max-uploads"),
        const_cast<char*>("2"),
        const_cast<char*>("--keep-local"),
        const_cast<char*>("--verbose")
    };
    Config config = Config::fromArgs(16, argv);

    EXPECT_EQ(config.data_dir, "/srv/relayq");
    EXPECT_EQ(config.download_dir, "/scratch/dl");
    EXPECT_EQ(config.remote_root, "/mnt/share");
    EXPECT_TRUE(config.enable_logging);
    EXPECT_EQ(config.log_dir, "/tmp/logs");
    EXPECT_EQ(config.max_concurrent_downloads, 3);
    EXPECT_EQ(config.max_concurrent_uploads, 2);
    EXPECT_FALSE(config.delete_after_upload);
    EXPECT_TRUE(config.log_to_stderr);
}

TEST_F(ConfigTest, FromArgsTildeExpansion) {
    char* argv[] = {
        const_cast<char*>("relayq"),
        const_cast<char*>("--data"),
        const_cast<char*>("~/rq")
    };
    Config config = Config::fromArgs(3, argv);

    EXPECT_EQ(config.data_dir, home_->path() + "/rq");
    EXPECT_EQ(config.download_dir, home_->path() + "/rq/downloads");
}

TEST_F(ConfigTest, FromArgsInvalidPoolSize) {
    char* argv[] = {
        const_cast<char*>("relayq"),
        const_cast<char*>("--max-downloads"),
        const_cast<char*>("lots"),
        const_cast<char*>("--max-uploads"),
        const_cast<char*>("-4")
    };
    Config config = Config::fromArgs(5, argv);

    // Invalid values keep the defaults
    EXPECT_EQ(config.max_concurrent_downloads, 8);
    EXPECT_EQ(config.max_concurrent_uploads, 8);
}

TEST_F(ConfigTest, FromArgsMissingValue) {
    char* argv[] = {
        const_cast<char*>("relayq"),
        const_cast<char*>("--log")
    };
    Config config = Config::fromArgs(2, argv);

    EXPECT_FALSE(config.enable_logging);
    EXPECT_TRUE(config.log_dir.empty());
}

// Flags override values from <data_dir>/config.json
TEST_F(ConfigTest, FromArgsOverridesSavedConfig) {
    TempDir data("config_data");

    Config saved;
    saved.data_dir = data.path();
    saved.max_concurrent_uploads = 5;
    saved.max_queue_size = 7;
    saved.remote_root = "/mnt/saved";
    saved.save();

    std::string data_dir = data.path();
    char* argv[] = {
        const_cast<char*>("relayq"),
        const_cast<char*>("--data"),
        const_cast<char*>(data_dir.c_str()),
        const_cast<char*>("--max-uploads"),
        const_cast<char*>("1")
    };
    Config config = Config::fromArgs(5, argv);

    EXPECT_EQ(config.max_concurrent_uploads, 1);
    EXPECT_EQ(config.max_queue_size, 7);
    EXPECT_EQ(config.remote_root, "/mnt/saved");
}

// ========== JSON Serialization Tests ==========

TEST_F(ConfigTest, ToJsonContainsAllFields) {
    Config config;
    config.data_dir = "/d";
    std::string json = config.toJson();

    EXPECT_NE(json.find("\"max_concurrent_downloads\""), std::string::npos);
    EXPECT_NE(json.find("\"max_queue_size\""), std::string::npos);
    EXPECT_NE(json.find("\"relay_chunk_size\""), std::string::npos);
    EXPECT_NE(json.find("\"id_pattern\""), std::string::npos);
    EXPECT_NE(json.find("\"remote_root\""), std::string::npos);
    EXPECT_NE(json.find("\"enable_logging\""), std::string::npos);

    // Runtime-only flag is not persisted
    EXPECT_EQ(json.find("log_to_stderr"), std::string::npos);
}

TEST_F(ConfigTest, FromJsonPartialFields) {
    Config config = Config::fromJson("{\"max_concurrent_downloads\": 2, \"user_agent\": \"x/2\"}");

    EXPECT_EQ(config.max_concurrent_downloads, 2);
    EXPECT_EQ(config.user_agent, "x/2");
    EXPECT_EQ(config.max_concurrent_uploads, 8);
    EXPECT_EQ(config.payload_extension, ".mp4");
}

TEST_F(ConfigTest, FromJsonInvalidJson) {
    EXPECT_THROW(Config::fromJson("{ invalid json }"), RelayqException);
}

TEST_F(ConfigTest, JsonRoundTrip) {
    Config original;
    original.max_concurrent_downloads = 4;
    original.max_concurrent_uploads = 3;
    original.max_queue_size = 50;
    original.tick_interval_ms = 250;
    original.progress_interval_ms = 100;
    original.download_chunk_size = 65536;
    original.relay_chunk_size = 4096;
    original.delete_after_upload = false;
    original.connect_timeout_s = 5;
    original.payload_extension = ".mkv";
    original.data_dir = "/home/user/.relayq/testhost";
    original.download_dir = "/scratch";
    original.remote_root = "/mnt/share";
    original.log_dir = "/var/log/relayq";
    original.enable_logging = true;

    Config restored = Config::fromJson(original.toJson());

    EXPECT_EQ(original, restored);
}

TEST_F(ConfigTest, LoadMissingFileGivesDefaults) {
    TempDir data("config_missing");
    Config config = Config::load(data.path());

    EXPECT_EQ(config.data_dir, data.path());
    EXPECT_EQ(config.download_dir, data.path() + "/downloads");
    EXPECT_EQ(config.max_concurrent_downloads, 8);
}

TEST_F(ConfigTest, SaveWithoutDataDirThrows) {
    Config config;
    EXPECT_THROW(config.save(), RelayqException);
}

// ========== Equality Operator Tests ==========

TEST_F(ConfigTest, EqualityOperator) {
    Config a, b;
    EXPECT_EQ(a, b);

    a.max_queue_size = 3;
    EXPECT_NE(a, b);

    b.max_queue_size = 3;
    EXPECT_EQ(a, b);
}

} // namespace
} // namespace relayq
