#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace swiftget {

/**
 * Immutable snapshot of the engine tunables.
 * Each job captures its own copy when it is dispatched; changing the
 * configuration afterwards only affects work created later.
 */
struct DownloadSettings {
    int maxConcurrentChunks       = 8;
    int bufferSize                = 8192;   // bytes per read/write
    int timeoutSeconds            = 180;
    int maxRetries                = 5;      // per byte range
    int retryDelayMs              = 1000;
    int maxRetryDelayMs           = 16000;
    int connectionLimit           = 16;
    bool enableConnectionPooling  = true;
    bool enableCompression        = true;

    int maxConcurrentJobs         = 3;
    int maxJobRetries             = 3;
    uint64_t chunkThresholdBytes  = 1024 * 1024;
    std::string downloadDirectory;

    // Copy with every numeric field clamped to a usable range.
    DownloadSettings normalized() const;
};

void to_json(nlohmann::json& j, const DownloadSettings& s);
void from_json(const nlohmann::json& j, DownloadSettings& s);

}  // namespace swiftget
