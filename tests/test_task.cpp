/**
 * @file test_task.cpp
 * @brief Unit tests for Task data structure and JSON serialization
 */

#include <gtest/gtest.h>
#include "relayq/task.h"
#include "relayq/errors.h"
#include "relayq/progress.h"

namespace relayq {
namespace testing {

class TaskTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a sample task for testing
        sample_task_.id = "ABC-XYZ-123";
        sample_task_.title = "ABC-XYZ-123 Sample";
        sample_task_.source_ref = "http://cdn.example/abc-xyz-123.mp4";
        sample_task_.metadata = {{"added", "2024-01-15"}, {"rating", "4.5"}};
        sample_task_.status = TaskStatus::DOWNLOADING;
        sample_task_.download_progress = 42.5;
        sample_task_.local_path = "/data/downloads/ABC-XYZ-123 Sample.mp4.part";
        sample_task_.last_updated = std::chrono::system_clock::now();
    }

    Task sample_task_;
};

// Test TaskStatus to string conversion
TEST_F(TaskTest, TaskStatusToString) {
    EXPECT_EQ(taskStatusToString(TaskStatus::PENDING_DOWNLOAD), "pending_download");
    EXPECT_EQ(taskStatusToString(TaskStatus::DOWNLOADING), "downloading");
    EXPECT_EQ(taskStatusToString(TaskStatus::PENDING_UPLOAD), "pending_upload");
    EXPECT_EQ(taskStatusToString(TaskStatus::UPLOADING), "uploading");
    EXPECT_EQ(taskStatusToString(TaskStatus::COMPLETED), "completed");
    EXPECT_EQ(taskStatusToString(TaskStatus::SKIPPED_UPLOAD), "skipped_upload");
    EXPECT_EQ(taskStatusToString(TaskStatus::PAUSED), "paused");
    EXPECT_EQ(taskStatusToString(TaskStatus::ERROR), "error");
    EXPECT_EQ(taskStatusToString(TaskStatus::FAILED_DOWNLOAD), "failed_download");
    EXPECT_EQ(taskStatusToString(TaskStatus::FAILED_UPLOAD), "failed_upload");
}

// Test TaskStatus from string conversion
TEST_F(TaskTest, TaskStatusFromString) {
    EXPECT_EQ(taskStatusFromString("pending_download"), TaskStatus::PENDING_DOWNLOAD);
    EXPECT_EQ(taskStatusFromString("uploading"), TaskStatus::UPLOADING);
    EXPECT_EQ(taskStatusFromString("skipped_upload"), TaskStatus::SKIPPED_UPLOAD);
    EXPECT_EQ(taskStatusFromString("failed_upload"), TaskStatus::FAILED_UPLOAD);
}

// Test invalid status string throws exception
TEST_F(TaskTest, TaskStatusFromStringInvalid) {
    EXPECT_THROW(taskStatusFromString("invalid"), std::invalid_argument);
    EXPECT_THROW(taskStatusFromString(""), std::invalid_argument);
}

// Test Task JSON serialization round-trip
TEST_F(TaskTest, JsonRoundTrip) {
    std::string json = sample_task_.toJson();
    Task restored = Task::fromJson(json);

    EXPECT_EQ(restored.id, sample_task_.id);
    EXPECT_EQ(restored.title, sample_task_.title);
    EXPECT_EQ(restored.source_ref, sample_task_.source_ref);
    EXPECT_EQ(restored.metadata, sample_task_.metadata);
    EXPECT_EQ(restored.status, TaskStatus::DOWNLOADING);
    EXPECT_DOUBLE_EQ(restored.download_progress, 42.5);
    EXPECT_EQ(restored.local_path, sample_task_.local_path);
    EXPECT_FALSE(restored.local_released);
    EXPECT_EQ(restored, sample_task_);
}

// Empty optional fields serialize as null and come back empty
TEST_F(TaskTest, JsonRoundTripMinimal) {
    Task minimal;
    minimal.id = "A-B-1";
    minimal.last_updated = std::chrono::system_clock::now();

    std::string json = minimal.toJson();
    EXPECT_NE(json.find("\"local_path\":null"), std::string::npos);

    Task restored = Task::fromJson(json);
    EXPECT_EQ(restored.id, "A-B-1");
    EXPECT_EQ(restored.status, TaskStatus::PENDING_DOWNLOAD);
    EXPECT_TRUE(restored.local_path.empty());
    EXPECT_TRUE(restored.error_message.empty());
}

// Test Task equality operator
TEST_F(TaskTest, EqualityOperator) {
    std::string json = sample_task_.toJson();
    Task t1 = Task::fromJson(json);
    Task t2 = Task::fromJson(json);

    EXPECT_EQ(t1, t2);

    t2.local_released = true;
    EXPECT_NE(t1, t2);
}

// Test Task helper methods
TEST_F(TaskTest, HelperMethods) {
    Task task;

    task.status = TaskStatus::COMPLETED;
    EXPECT_TRUE(task.isFinal());
    EXPECT_FALSE(task.isFailed());

    task.status = TaskStatus::SKIPPED_UPLOAD;
    EXPECT_TRUE(task.isFinal());

    task.status = TaskStatus::ERROR;
    EXPECT_FALSE(task.isFinal());
    EXPECT_TRUE(task.isFailed());

    task.status = TaskStatus::FAILED_DOWNLOAD;
    EXPECT_TRUE(task.isFailed());

    task.status = TaskStatus::PAUSED;
    EXPECT_FALSE(task.isFinal());
    EXPECT_FALSE(task.isFailed());

    EXPECT_TRUE(isPartialPath("/x/a.mp4.part"));
    EXPECT_FALSE(isPartialPath("/x/a.mp4"));
    EXPECT_FALSE(isPartialPath(""));
}

// Display progress follows the active side of the pipeline
TEST_F(TaskTest, DisplayProgress) {
    Task task;
    task.download_progress = 30.0;
    task.upload_progress = 70.0;

    task.status = TaskStatus::DOWNLOADING;
    EXPECT_DOUBLE_EQ(task.displayProgress(), 30.0);
    task.status = TaskStatus::UPLOADING;
    EXPECT_DOUBLE_EQ(task.displayProgress(), 70.0);
    task.status = TaskStatus::COMPLETED;
    EXPECT_DOUBLE_EQ(task.displayProgress(), 100.0);
    task.status = TaskStatus::PENDING_UPLOAD;
    EXPECT_DOUBLE_EQ(task.displayProgress(), 0.0);
}

// Test invalid JSON throws exception
TEST_F(TaskTest, InvalidJsonThrows) {
    EXPECT_THROW(Task::fromJson("not valid json"), RelayqException);
    EXPECT_THROW(Task::fromJson("{}"), RelayqException);
    EXPECT_THROW(Task::fromJson("{\"id\": \"A-B-1\", \"status\": \"bogus\"}"), RelayqException);
}

TEST(ProgressTest, PercentOf) {
    EXPECT_DOUBLE_EQ(percentOf(50, 200), 25.0);
    EXPECT_DOUBLE_EQ(percentOf(10, 0), 0.0);
    EXPECT_DOUBLE_EQ(percentOf(300, 200), 100.0);

    EXPECT_FALSE(isTerminal(ProgressEvent{event::Transferring{1, 2, 0.0}}));
    EXPECT_TRUE(isTerminal(ProgressEvent{event::Paused{"stop"}}));
}

// Test ErrorCode to string conversion
TEST(ErrorsTest, ErrorCodeToString) {
    EXPECT_EQ(errorCodeToString(ErrorCode::SUCCESS), "Success");
    EXPECT_EQ(errorCodeToString(ErrorCode::TASK_NOT_FOUND), "Task not found");
    EXPECT_EQ(errorCodeToString(ErrorCode::TRANSFER_SIZE_MISMATCH), "Transfer size mismatch");
    EXPECT_EQ(errorCodeToString(ErrorCode::RELAY_REMOTE_UNAVAILABLE), "Remote store unavailable");
    EXPECT_EQ(errorCodeToString(ErrorCode::FILE_NOT_FOUND), "File not found");
}

// Test RelayqException
TEST(ErrorsTest, RelayqException) {
    RelayqException ex1(ErrorCode::TASK_NOT_FOUND);
    EXPECT_EQ(ex1.code(), ErrorCode::TASK_NOT_FOUND);
    EXPECT_EQ(ex1.message(), "");
    EXPECT_EQ(std::string(ex1.what()), "Task not found");

    RelayqException ex2(ErrorCode::FILE_PARSE_ERROR, "invalid format");
    EXPECT_EQ(ex2.code(), ErrorCode::FILE_PARSE_ERROR);
    EXPECT_EQ(ex2.message(), "invalid format");
    EXPECT_EQ(std::string(ex2.what()), "File parse error: invalid format");
}

} // namespace testing
} // namespace relayq
