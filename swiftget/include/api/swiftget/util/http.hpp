#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include "core/DownloadSettings.hpp"
#include "core/Result.hpp"
#include "utils/cancel_token.hpp"

namespace swiftget {

// Everything a HEAD probe tells about a resource.
struct ResourceMetadata {
    uint64_t size       = 0;
    bool supportsRange  = false;
    std::string lastModified;
    std::string contentType;
    std::string etag;
};

// Parsed "bytes <start>-<end>/<total|*>".
struct ContentRange {
    uint64_t start = 0;
    uint64_t end   = 0;
    std::optional<uint64_t> total;
};

std::optional<ContentRange> parseContentRange(const std::string& value);

// min(base * 2^attempt, maxDelay), without jitter.
std::chrono::milliseconds backoffDelay(int attempt, int baseDelayMs, int maxDelayMs);
// Uniform in [0, min(base / 2, 500)] ms.
std::chrono::milliseconds backoffJitter(int baseDelayMs);

// Classifies a final HTTP status that is not what the request expected.
Error httpStatusError(long status, const std::string& url);

// Called with the number of new bytes after every buffer written to disk.
using ProgressCallback = std::function<void(uint64_t)>;

/**
 * HTTP side of the engine.
 *
 * HEAD probes go through cpr, bodies are streamed with libcurl so they can
 * be validated before the first byte lands on disk and aborted on
 * cancellation. Every body transfer is retried with exponential backoff.
 */
class TransferClient {
public:
    using Headers = std::map<std::string, std::string>;

    explicit TransferClient(DownloadSettings settings, Headers headers = {});

    Result<uint64_t> probeLength(const std::string& url) const;
    bool probeRangeSupport(const std::string& url) const;
    Result<ResourceMetadata> probeMetadata(const std::string& url) const;

    /**
     * GET bytes [start, end] of url and append them to destinationFile.
     * The response must be a 206 whose Content-Range matches the request
     * exactly. A retry continues after the bytes already appended.
     *
     * @return bytes appended by this call
     */
    Result<uint64_t> fetchRange(const std::string& url, uint64_t start, uint64_t end,
                                const std::string& destinationFile, const CancelToken& token,
                                const ProgressCallback& progress = nullptr) const;

    /**
     * Sequential GET of the whole resource. With resumeFrom > 0 the request
     * carries "Range: bytes=<resumeFrom>-" and a 206 reply is appended; a 200
     * reply truncates the file and starts over.
     *
     * @return final length of destinationFile
     */
    Result<uint64_t> fetchStream(const std::string& url, const std::string& destinationFile, uint64_t resumeFrom,
                                 const CancelToken& token, const ProgressCallback& progress = nullptr) const;

    // Whole resource into a fresh file.
    Result<uint64_t> fetchToFile(const std::string& url, const std::string& destinationFile, const CancelToken& token,
                                 const ProgressCallback& progress = nullptr) const;

    const DownloadSettings& settings() const { return settings_; }
    const Headers& headers() const { return headers_; }

private:
    struct Request;

    Result<uint64_t> perform(Request& request, const CancelToken& token) const;

    template <typename Attempt>
    Result<uint64_t> withRetry(const std::string& what, const CancelToken& token, Attempt attempt) const;

    DownloadSettings settings_;
    Headers headers_;
};

}  // namespace swiftget
