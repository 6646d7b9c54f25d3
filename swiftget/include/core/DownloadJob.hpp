#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace swiftget {

enum class DownloadStatus {
    PENDING,
    DOWNLOADING,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class DownloadType {
    DIRECT,
    SEGMENTED,
    EXTERNAL
};

enum class ChunkStatus {
    PENDING,
    DOWNLOADING,
    COMPLETED,
    FAILED
};

const char* statusName(DownloadStatus status);
const char* typeName(DownloadType type);

// Inclusive byte range [start, end] of a job's resource.
struct DownloadChunk {
    size_t index = 0;
    uint64_t start = 0;
    uint64_t end = 0;
    uint64_t downloadedBytes = 0;
    ChunkStatus status = ChunkStatus::PENDING;
    std::string error;
    std::string tempFilePath;
    std::chrono::system_clock::time_point startTime;
    std::chrono::system_clock::time_point endTime;

    DownloadChunk() = default;
    DownloadChunk(size_t i, uint64_t s, uint64_t e) : index(i), start(s), end(e) {}

    uint64_t size() const { return end - start + 1; }
    uint64_t remaining() const { return size() - downloadedBytes; }
    bool isComplete() const { return downloadedBytes >= size(); }
    bool isFailed() const { return status == ChunkStatus::FAILED; }
};

// What a front-end (URL analyzer, playlist parser, ...) hands to the engine.
struct JobDescriptor {
    std::string sourceUrl;
    std::string title;
    DownloadType type = DownloadType::DIRECT;
    std::string fileExtension;
    uint64_t expectedSize = 0;
    std::vector<std::string> segmentUrls;
    std::map<std::string, std::string> metadata;
    std::map<std::string, std::string> headers;
};

/**
 * One user-requested download.
 *
 * Byte counters and status are atomics because chunk workers, the
 * dispatcher and observers touch them from different threads; string
 * fields sit behind a mutex and are returned by copy.
 */
class DownloadJob {
public:
    static constexpr const char* CHECKSUM_KEY = "Checksum";

    DownloadJob(std::string id, const JobDescriptor& descriptor, std::string outputPath, int maxRetries);

    const std::string& id() const { return id_; }
    DownloadType type() const { return type_; }

    std::string title() const;
    std::string sourceUrl() const;
    std::string outputPath() const;
    void setOutputPath(const std::string& path);

    // First segment URL when present, otherwise the source URL.
    std::string resourceUrl() const;
    std::vector<std::string> segmentUrls() const;
    void setSegmentUrls(const std::vector<std::string>& urls);

    std::map<std::string, std::string> headers() const;
    std::map<std::string, std::string> metadata() const;
    std::optional<std::string> metadataValue(const std::string& key) const;
    void setMetadata(const std::string& key, const std::string& value);

    DownloadStatus getStatus() const { return status_.load(); }
    void setStatus(DownloadStatus status) { status_.store(status); }

    uint64_t getTotalSize() const { return totalSize_.load(); }
    void setTotalSize(uint64_t size) { totalSize_.store(size); }
    // Grows the total to at least size, never shrinks it.
    void raiseTotalSize(uint64_t size);

    uint64_t getDownloadedBytes() const { return downloadedBytes_.load(); }
    void setDownloadedBytes(uint64_t bytes) { downloadedBytes_.store(bytes); }
    // Atomic accumulation used by concurrently running chunk writers.
    uint64_t addDownloadedBytes(uint64_t delta) { return downloadedBytes_.fetch_add(delta) + delta; }

    // Percentage in [0, 100]; zero while the total size is unknown.
    double getProgress() const;
    // Bytes already on disk when this run began; they do not count towards the speed.
    void setResumeOffset(uint64_t bytes) { resumeOffset_.store(bytes); }
    double getSpeed() const;
    int getTimeRemaining() const;

    int getRetryCount() const { return retryCount_.load(); }
    void setRetryCount(int count) { retryCount_.store(count); }
    int getMaxRetries() const { return maxRetries_; }
    bool canRetry() const;
    void incrementRetry() { retryCount_.fetch_add(1); }

    std::string getError() const;
    void setError(const std::string& error);

    std::chrono::system_clock::time_point getStartTime() const;
    std::optional<std::chrono::system_clock::time_point> getEndTime() const;

    void markStarted();
    void markCompleted();
    void markFailed(const std::string& error);
    void markCancelled();
    void markPaused();
    void markPending();

private:
    const std::string id_;
    const DownloadType type_;
    const int maxRetries_;

    std::string title_;
    std::string sourceUrl_;
    std::string outputPath_;
    std::vector<std::string> segmentUrls_;
    std::map<std::string, std::string> metadata_;
    std::map<std::string, std::string> headers_;
    std::string error_;
    std::chrono::system_clock::time_point startTime_;
    std::optional<std::chrono::system_clock::time_point> endTime_;
    mutable std::mutex mutex_;

    std::atomic<DownloadStatus> status_{DownloadStatus::PENDING};
    std::atomic<uint64_t> totalSize_{0};
    std::atomic<uint64_t> downloadedBytes_{0};
    std::atomic<uint64_t> resumeOffset_{0};
    std::atomic<int> retryCount_{0};
};

using JobHandle = std::shared_ptr<DownloadJob>;

}  // namespace swiftget
