#include "core/DownloadJob.hpp"

#include <algorithm>

namespace swiftget {

const char* statusName(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::PENDING:
            return "Pending";
        case DownloadStatus::DOWNLOADING:
            return "Downloading";
        case DownloadStatus::PAUSED:
            return "Paused";
        case DownloadStatus::COMPLETED:
            return "Completed";
        case DownloadStatus::FAILED:
            return "Failed";
        case DownloadStatus::CANCELLED:
            return "Cancelled";
    }
    return "Unknown";
}

const char* typeName(DownloadType type) {
    switch (type) {
        case DownloadType::DIRECT:
            return "direct";
        case DownloadType::SEGMENTED:
            return "segmented";
        case DownloadType::EXTERNAL:
            return "external";
    }
    return "unknown";
}

DownloadJob::DownloadJob(std::string id, const JobDescriptor& descriptor, std::string outputPath, int maxRetries)
    : id_(std::move(id)),
      type_(descriptor.type),
      maxRetries_(maxRetries),
      title_(descriptor.title),
      sourceUrl_(descriptor.sourceUrl),
      outputPath_(std::move(outputPath)),
      segmentUrls_(descriptor.segmentUrls),
      metadata_(descriptor.metadata),
      headers_(descriptor.headers),
      startTime_(std::chrono::system_clock::now()) {
    totalSize_.store(descriptor.expectedSize);
}

std::string DownloadJob::title() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return title_;
}

std::string DownloadJob::sourceUrl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sourceUrl_;
}

std::string DownloadJob::outputPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outputPath_;
}

void DownloadJob::setOutputPath(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputPath_ = path;
}

std::string DownloadJob::resourceUrl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segmentUrls_.empty() ? sourceUrl_ : segmentUrls_.front();
}

std::vector<std::string> DownloadJob::segmentUrls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segmentUrls_;
}

void DownloadJob::setSegmentUrls(const std::vector<std::string>& urls) {
    std::lock_guard<std::mutex> lock(mutex_);
    segmentUrls_ = urls;
}

std::map<std::string, std::string> DownloadJob::headers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return headers_;
}

std::map<std::string, std::string> DownloadJob::metadata() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
}

std::optional<std::string> DownloadJob::metadataValue(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metadata_.find(key);
    if (it == metadata_.end()) return std::nullopt;
    return it->second;
}

void DownloadJob::setMetadata(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    metadata_[key] = value;
}

double DownloadJob::getProgress() const {
    uint64_t total = totalSize_.load();
    if (total == 0) return 0.0;
    uint64_t done = std::min(downloadedBytes_.load(), total);
    return static_cast<double>(done) / static_cast<double>(total) * 100.0;
}

void DownloadJob::raiseTotalSize(uint64_t size) {
    uint64_t current = totalSize_.load();
    while (current < size && !totalSize_.compare_exchange_weak(current, size)) {
    }
}

// Average bytes per second since the job was last started.
double DownloadJob::getSpeed() const {
    auto elapsed = std::chrono::duration<double>(std::chrono::system_clock::now() - getStartTime()).count();
    uint64_t done   = downloadedBytes_.load();
    uint64_t offset = resumeOffset_.load();
    if (elapsed <= 0.0 || done <= offset) return 0.0;
    return static_cast<double>(done - offset) / elapsed;
}

int DownloadJob::getTimeRemaining() const {
    uint64_t total = totalSize_.load();
    uint64_t done  = downloadedBytes_.load();
    double speed   = getSpeed();
    if (total == 0 || done >= total || speed <= 0.0) return 0;
    return static_cast<int>(static_cast<double>(total - done) / speed);
}

bool DownloadJob::canRetry() const {
    return status_.load() == DownloadStatus::FAILED && retryCount_.load() < maxRetries_;
}

std::string DownloadJob::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void DownloadJob::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
}

std::chrono::system_clock::time_point DownloadJob::getStartTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return startTime_;
}

std::optional<std::chrono::system_clock::time_point> DownloadJob::getEndTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endTime_;
}

void DownloadJob::markStarted() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        startTime_ = std::chrono::system_clock::now();
        endTime_.reset();
        error_.clear();
    }
    resumeOffset_.store(downloadedBytes_.load());
    status_.store(DownloadStatus::DOWNLOADING);
}

void DownloadJob::markCompleted() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        endTime_ = std::chrono::system_clock::now();
    }
    uint64_t done = downloadedBytes_.load();
    if (totalSize_.load() < done) totalSize_.store(done);
    downloadedBytes_.store(totalSize_.load());
    status_.store(DownloadStatus::COMPLETED);
}

void DownloadJob::markFailed(const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        endTime_ = std::chrono::system_clock::now();
        error_   = error;
    }
    status_.store(DownloadStatus::FAILED);
}

void DownloadJob::markCancelled() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        endTime_ = std::chrono::system_clock::now();
    }
    status_.store(DownloadStatus::CANCELLED);
}

void DownloadJob::markPaused() { status_.store(DownloadStatus::PAUSED); }

void DownloadJob::markPending() {
    setError("");
    status_.store(DownloadStatus::PENDING);
}

}  // namespace swiftget
