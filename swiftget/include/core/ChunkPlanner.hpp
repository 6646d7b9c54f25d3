#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/DownloadJob.hpp"
#include "core/DownloadSettings.hpp"
#include "core/FileStore.hpp"
#include "core/Result.hpp"
#include "swiftget/util/http.hpp"
#include "utils/cancel_token.hpp"
#include "utils/permit_pool.hpp"

namespace swiftget {

/**
 * Parallel ranged download of a single resource.
 *
 * The resource is split into contiguous chunks, each fetched into its own
 * temp file under a permit pool owned by this planner, then merged in
 * index order, verified and moved into place.
 */
class ChunkPlanner {
public:
    static constexpr uint64_t CHUNK_UNIT = 1024 * 1024;
    static constexpr size_t MIN_CHUNKS   = 4;
    static constexpr size_t MAX_CHUNKS   = 16;

    ChunkPlanner(const DownloadSettings& settings, const TransferClient::Headers& headers = {});

    // clamp(ceil(size / 1 MiB), 4, 16), or the override when non-zero.
    static size_t planChunkCount(uint64_t size, size_t chunkCountOverride = 0);

    // Splits [0, size) into chunkCount inclusive ranges; the first (size % chunkCount) get one extra byte.
    static std::vector<DownloadChunk> partition(uint64_t size, size_t chunkCount, const std::string& basePath);

    Status runChunked(const std::string& resourceUrl, const std::string& outputPath, DownloadJob& job,
                      const CancelToken& cancel, size_t chunkCountOverride = 0);

    const TransferClient& client() const { return client_; }

private:
    Status runChunk(const std::string& url, DownloadChunk& chunk, DownloadJob& job, const CancelToken& cancel);

    DownloadSettings settings_;
    TransferClient client_;
    FileStore store_;
    PermitPool permits_;
};

}  // namespace swiftget
