#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "core/DownloadJob.hpp"

using namespace swiftget;

namespace {

DownloadJob makeJob(int maxRetries = 2) {
    JobDescriptor descriptor;
    descriptor.sourceUrl    = "https://example.com/file.bin";
    descriptor.title        = "file";
    descriptor.expectedSize = 1000;
    return DownloadJob("00000000deadbeef", descriptor, "/tmp/file.bin", maxRetries);
}

}  // namespace

TEST(DownloadJobTest, StartsPendingWithExpectedSize) {
    auto job = makeJob();
    EXPECT_EQ(job.getStatus(), DownloadStatus::PENDING);
    EXPECT_EQ(job.getTotalSize(), 1000u);
    EXPECT_EQ(job.getDownloadedBytes(), 0u);
    EXPECT_EQ(job.resourceUrl(), "https://example.com/file.bin");
    EXPECT_FALSE(job.getEndTime().has_value());
}

TEST(DownloadJobTest, ProgressIsAPercentage) {
    auto job = makeJob();
    job.setDownloadedBytes(250);
    EXPECT_DOUBLE_EQ(job.getProgress(), 25.0);
    job.setDownloadedBytes(5000);
    EXPECT_DOUBLE_EQ(job.getProgress(), 100.0);
    job.setTotalSize(0);
    EXPECT_DOUBLE_EQ(job.getProgress(), 0.0);
}

TEST(DownloadJobTest, CompletedJobReportsFullSize) {
    auto job = makeJob();
    job.markStarted();
    job.setDownloadedBytes(1200);
    job.markCompleted();
    EXPECT_EQ(job.getStatus(), DownloadStatus::COMPLETED);
    EXPECT_EQ(job.getTotalSize(), 1200u);
    EXPECT_EQ(job.getDownloadedBytes(), 1200u);
    EXPECT_TRUE(job.getEndTime().has_value());
}

TEST(DownloadJobTest, RetryOnlyFromFailedWithinBound) {
    auto job = makeJob(2);
    EXPECT_FALSE(job.canRetry());
    job.markFailed("HTTP 404");
    EXPECT_EQ(job.getError(), "HTTP 404");
    EXPECT_TRUE(job.canRetry());
    job.incrementRetry();
    job.incrementRetry();
    EXPECT_FALSE(job.canRetry());

    job.markPending();
    EXPECT_TRUE(job.getError().empty());
    EXPECT_FALSE(job.canRetry());
}

TEST(DownloadJobTest, StartClearsPreviousRun) {
    auto job = makeJob();
    job.markFailed("boom");
    job.markStarted();
    EXPECT_EQ(job.getStatus(), DownloadStatus::DOWNLOADING);
    EXPECT_TRUE(job.getError().empty());
    EXPECT_FALSE(job.getEndTime().has_value());
}

TEST(DownloadJobTest, ConcurrentByteCountsAddUp) {
    auto job = makeJob();
    std::vector<std::thread> writers;
    for (int t = 0; t < 8; t++) {
        writers.emplace_back([&job]() {
            for (int i = 0; i < 10000; i++) job.addDownloadedBytes(3);
        });
    }
    for (auto& writer : writers) writer.join();
    EXPECT_EQ(job.getDownloadedBytes(), 8u * 10000u * 3u);
}

TEST(DownloadJobTest, SegmentUrlsOverrideTheSource) {
    auto job = makeJob();
    job.setSegmentUrls({"https://cdn.example.com/a", "https://cdn.example.com/b"});
    EXPECT_EQ(job.resourceUrl(), "https://cdn.example.com/a");
    EXPECT_EQ(job.segmentUrls().size(), 2u);
}

TEST(DownloadJobTest, Names) {
    EXPECT_STREQ(statusName(DownloadStatus::PAUSED), "Paused");
    EXPECT_STREQ(statusName(DownloadStatus::CANCELLED), "Cancelled");
    EXPECT_STREQ(typeName(DownloadType::SEGMENTED), "segmented");
}

TEST(DownloadJobTest, SpeedIgnoresBytesFromAnEarlierRun) {
    auto job = makeJob();
    job.setTotalSize(10000000);
    job.setDownloadedBytes(9000000);
    job.markStarted();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    job.addDownloadedBytes(1000);

    // About 1000 bytes in 0.1s, nowhere near 9 MB/s.
    EXPECT_GT(job.getSpeed(), 0.0);
    EXPECT_LE(job.getSpeed(), 10000.0);
    EXPECT_GE(job.getTimeRemaining(), 99);

    job.setResumeOffset(9001000);
    EXPECT_DOUBLE_EQ(job.getSpeed(), 0.0);
    EXPECT_EQ(job.getTimeRemaining(), 0);
}

TEST(DownloadJobTest, TotalSizeOnlyGrows) {
    auto job = makeJob();
    job.raiseTotalSize(500);
    EXPECT_EQ(job.getTotalSize(), 1000u);

    std::vector<std::thread> raisers;
    for (uint64_t t = 1; t <= 8; t++) {
        raisers.emplace_back([&job, t]() {
            for (uint64_t i = 0; i < 1000; i++) job.raiseTotalSize(t * 1000 + i);
        });
    }
    for (auto& raiser : raisers) raiser.join();
    EXPECT_EQ(job.getTotalSize(), 8999u);
}
