#include "core/DownloadSettings.hpp"

#include <algorithm>

namespace swiftget {

DownloadSettings DownloadSettings::normalized() const {
    DownloadSettings s = *this;
    s.maxConcurrentChunks = std::clamp(s.maxConcurrentChunks, 1, 64);
    s.bufferSize          = std::clamp(s.bufferSize, 1024, 8 * 1024 * 1024);
    s.timeoutSeconds      = std::clamp(s.timeoutSeconds, 1, 3600);
    s.maxRetries          = std::clamp(s.maxRetries, 0, 100);
    s.retryDelayMs        = std::clamp(s.retryDelayMs, 0, 600000);
    s.maxRetryDelayMs     = std::max(s.maxRetryDelayMs, s.retryDelayMs);
    s.connectionLimit     = std::clamp(s.connectionLimit, 1, 256);
    s.maxConcurrentJobs   = std::clamp(s.maxConcurrentJobs, 1, 32);
    s.maxJobRetries       = std::max(s.maxJobRetries, 0);
    return s;
}

void to_json(nlohmann::json& j, const DownloadSettings& s) {
    j = nlohmann::json{
        {"maxConcurrentChunks", s.maxConcurrentChunks},
        {"bufferSize", s.bufferSize},
        {"timeoutSeconds", s.timeoutSeconds},
        {"maxRetries", s.maxRetries},
        {"retryDelayMs", s.retryDelayMs},
        {"maxRetryDelayMs", s.maxRetryDelayMs},
        {"connectionLimit", s.connectionLimit},
        {"enableConnectionPooling", s.enableConnectionPooling},
        {"enableCompression", s.enableCompression},
        {"maxConcurrentJobs", s.maxConcurrentJobs},
        {"maxJobRetries", s.maxJobRetries},
        {"chunkThresholdBytes", s.chunkThresholdBytes},
        {"downloadDirectory", s.downloadDirectory},
    };
}

// Missing keys keep whatever the target already holds, so older files load fine.
void from_json(const nlohmann::json& j, DownloadSettings& s) {
    s.maxConcurrentChunks     = j.value("maxConcurrentChunks", s.maxConcurrentChunks);
    s.bufferSize              = j.value("bufferSize", s.bufferSize);
    s.timeoutSeconds          = j.value("timeoutSeconds", s.timeoutSeconds);
    s.maxRetries              = j.value("maxRetries", s.maxRetries);
    s.retryDelayMs            = j.value("retryDelayMs", s.retryDelayMs);
    s.maxRetryDelayMs         = j.value("maxRetryDelayMs", s.maxRetryDelayMs);
    s.connectionLimit         = j.value("connectionLimit", s.connectionLimit);
    s.enableConnectionPooling = j.value("enableConnectionPooling", s.enableConnectionPooling);
    s.enableCompression       = j.value("enableCompression", s.enableCompression);
    s.maxConcurrentJobs       = j.value("maxConcurrentJobs", s.maxConcurrentJobs);
    s.maxJobRetries           = j.value("maxJobRetries", s.maxJobRetries);
    s.chunkThresholdBytes     = j.value("chunkThresholdBytes", s.chunkThresholdBytes);
    s.downloadDirectory       = j.value("downloadDirectory", s.downloadDirectory);
}

}  // namespace swiftget
