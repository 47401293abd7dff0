/**
 * @file test_transfer_engine.cpp
 * @brief Unit tests for TransferEngine and CurlHttpClient helpers
 *
 * Downloads run against FakeHttpClient; the files land in a scratch
 * directory under /tmp.
 */

#include <gtest/gtest.h>
#include "relayq/transfer_engine.h"
#include "relayq/curl_http_client.h"
#include "test_fakes.h"

#include <vector>

namespace relayq {
namespace testing {

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDir>("transfer");
        engine_ = std::make_unique<TransferEngine>(http_, logger_, std::chrono::milliseconds(0));
    }

    FetchResult fetch(const std::string& url, const std::string& name = "clip.mp4") {
        return engine_->fetch(url, dir_->path(), name,
                              [this](const event::Transferring& ev) { events_.push_back(ev); },
                              cancel_);
    }

    std::string finalPath(const std::string& name = "clip.mp4") const {
        return dir_->sub(name);
    }

    std::string partPath(const std::string& name = "clip.mp4") const {
        return dir_->sub(name + ".part");
    }

    Logger logger_;
    FakeHttpClient http_;
    CancellationToken cancel_;
    std::unique_ptr<TempDir> dir_;
    std::unique_ptr<TransferEngine> engine_;
    std::vector<event::Transferring> events_;
};

TEST_F(TransferEngineTest, FreshFetchWritesFinalFile) {
    std::string body = makePayload(100);
    http_.add("http://cdn/clip", body);

    FetchResult result = fetch("http://cdn/clip");

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.local_path, finalPath());
    EXPECT_EQ(result.bytes_received, 100u);
    EXPECT_EQ(readFile(finalPath()), body);
    EXPECT_FALSE(fileExists(partPath()));

    ASSERT_EQ(http_.calls().size(), 1u);
    EXPECT_EQ(http_.calls()[0].offset, 0u);
}

TEST_F(TransferEngineTest, ProgressIsMonotonic) {
    http_.add("http://cdn/clip", makePayload(64));
    ASSERT_TRUE(fetch("http://cdn/clip").ok());

    ASSERT_FALSE(events_.empty());
    for (size_t i = 1; i < events_.size(); ++i) {
        EXPECT_GE(events_[i].bytes_done, events_[i - 1].bytes_done);
    }
    EXPECT_EQ(events_.back().bytes_done, 64u);
    EXPECT_EQ(events_.back().bytes_total, 64u);
}

// Resuming N of T bytes transfers exactly T - N more
TEST_F(TransferEngineTest, ResumeFetchesOnlyMissingBytes) {
    std::string body = makePayload(100);
    http_.add("http://cdn/clip", body);
    writeFile(partPath(), body.substr(0, 40));

    FetchResult result = fetch("http://cdn/clip");

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.bytes_received, 60u);
    EXPECT_EQ(readFile(finalPath()), body);

    ASSERT_EQ(http_.calls().size(), 1u);
    EXPECT_EQ(http_.calls()[0].offset, 40u);
    EXPECT_EQ(events_.front().bytes_done, 40u);
    EXPECT_EQ(events_.front().bytes_total, 100u);
}

// Server answered 200 to a range request: start over
TEST_F(TransferEngineTest, FullResponseToRangeRestarts) {
    std::string body = makePayload(50);
    FakeHttpClient::Resource resource;
    resource.body = body;
    resource.honor_range = false;
    http_.add("http://cdn/clip", resource);
    writeFile(partPath(), "garbage-prefix");

    FetchResult result = fetch("http://cdn/clip");

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.bytes_received, 50u);
    EXPECT_EQ(readFile(finalPath()), body);
}

// A partial larger than the resource cannot be resumed
TEST_F(TransferEngineTest, RangeNotSatisfiableDiscardsPartial) {
    http_.add("http://cdn/clip", makePayload(10));
    writeFile(partPath(), makePayload(30));

    FetchResult result = fetch("http://cdn/clip");

    EXPECT_EQ(result.outcome, FetchOutcome::FAILED);
    EXPECT_EQ(result.error_code, ErrorCode::TRANSFER_HTTP_STATUS);
    EXPECT_FALSE(fileExists(partPath()));
    EXPECT_FALSE(fileExists(finalPath()));
    EXPECT_TRUE(result.local_path.empty());
}

// A 416 for a partial that already holds every byte finishes it
TEST_F(TransferEngineTest, RangeNotSatisfiableWithWholePartialCompletes) {
    std::string body = makePayload(20);
    http_.add("http://cdn/clip", body);
    writeFile(partPath(), body);

    FetchResult result = fetch("http://cdn/clip");

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.bytes_received, 0u);
    EXPECT_EQ(readFile(finalPath()), body);
    EXPECT_FALSE(fileExists(partPath()));
}

TEST_F(TransferEngineTest, SizeMismatchKeepsPartial) {
    FakeHttpClient::Resource resource;
    resource.body = makePayload(30);
    resource.declared_length = 50;
    http_.add("http://cdn/clip", resource);

    FetchResult result = fetch("http://cdn/clip");

    EXPECT_EQ(result.outcome, FetchOutcome::FAILED);
    EXPECT_EQ(result.error_code, ErrorCode::TRANSFER_SIZE_MISMATCH);
    EXPECT_EQ(result.local_path, partPath());
    EXPECT_TRUE(fileExists(partPath()));
    EXPECT_FALSE(fileExists(finalPath()));
}

// A dropped connection leaves a partial the next fetch resumes
TEST_F(TransferEngineTest, TransportDropThenResume) {
    std::string body = makePayload(80);
    FakeHttpClient::Resource dropping;
    dropping.body = body;
    dropping.drop_after = 24;
    http_.add("http://cdn/clip", dropping);

    FetchResult first = fetch("http://cdn/clip");
    EXPECT_EQ(first.outcome, FetchOutcome::FAILED);
    EXPECT_EQ(first.error_code, ErrorCode::TRANSFER_FAILED);
    EXPECT_EQ(first.error, "connection reset");
    EXPECT_EQ(readFile(partPath()), body.substr(0, 24));

    http_.add("http://cdn/clip", body);
    FetchResult second = fetch("http://cdn/clip");
    ASSERT_TRUE(second.ok()) << second.error;
    EXPECT_EQ(second.bytes_received, 56u);
    EXPECT_EQ(readFile(finalPath()), body);
}

TEST_F(TransferEngineTest, CancelKeepsPartial) {
    http_.add("http://cdn/clip", makePayload(100));
    http_.setChunkHook([this](const std::string&, size_t sent) {
        if (sent >= 20) {
            cancel_.cancel();
        }
    });

    FetchResult result = fetch("http://cdn/clip");

    EXPECT_EQ(result.outcome, FetchOutcome::CANCELLED);
    EXPECT_EQ(result.error_code, ErrorCode::TRANSFER_CANCELLED);
    EXPECT_EQ(result.local_path, partPath());
    EXPECT_EQ(readFile(partPath()).size(), 20u);
    EXPECT_FALSE(fileExists(finalPath()));
}

TEST_F(TransferEngineTest, CancelledBeforeStartSendsNoRequest) {
    http_.add("http://cdn/clip", makePayload(10));
    cancel_.cancel();

    FetchResult result = fetch("http://cdn/clip");

    EXPECT_EQ(result.outcome, FetchOutcome::CANCELLED);
    EXPECT_TRUE(http_.calls().empty());
}

TEST_F(TransferEngineTest, ExistingFinalFileSkipsRequest) {
    writeFile(finalPath(), "already here");

    FetchResult result = fetch("http://cdn/clip");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.local_path, finalPath());
    EXPECT_TRUE(http_.calls().empty());
    EXPECT_EQ(readFile(finalPath()), "already here");
}

TEST_F(TransferEngineTest, HttpErrorStatusFails) {
    FetchResult result = fetch("http://cdn/missing");

    EXPECT_EQ(result.outcome, FetchOutcome::FAILED);
    EXPECT_EQ(result.error_code, ErrorCode::TRANSFER_HTTP_STATUS);
    EXPECT_EQ(result.error, "HTTP status 404");
    EXPECT_FALSE(fileExists(partPath()));
}

TEST_F(TransferEngineTest, PartialPathFor) {
    EXPECT_EQ(TransferEngine::partialPathFor("/d/a.mp4"), "/d/a.mp4.part");
}

// ========== CurlHttpClient ==========

TEST(CurlHttpClientTest, ParseContentRangeTotal) {
    EXPECT_EQ(CurlHttpClient::parseContentRangeTotal("bytes 0-99/200"), 200u);
    EXPECT_EQ(CurlHttpClient::parseContentRangeTotal("bytes */1234"), 1234u);
    EXPECT_FALSE(CurlHttpClient::parseContentRangeTotal("bytes 0-99/*").has_value());
    EXPECT_FALSE(CurlHttpClient::parseContentRangeTotal("bytes 0-99/").has_value());
    EXPECT_FALSE(CurlHttpClient::parseContentRangeTotal("garbage").has_value());
    EXPECT_FALSE(CurlHttpClient::parseContentRangeTotal("").has_value());
}

// Nothing listens on port 1 of the loopback interface
TEST(CurlHttpClientTest, ConnectionRefusedIsTransportFailure) {
    CurlOptions options;
    options.connect_timeout_s = 2;
    CurlHttpClient client(options);

    bool head_seen = false;
    HttpResult result = client.get(
        "http://127.0.0.1:1/clip", 0,
        [&head_seen](const HttpResponseHead&) { head_seen = true; return true; },
        [](const char*, std::size_t) { return true; });

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.aborted);
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(head_seen);
}

} // namespace testing
} // namespace relayq
