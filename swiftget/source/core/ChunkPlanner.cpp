#include "core/ChunkPlanner.hpp"

#include <borealis/core/logger.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <thread>

#include "swiftget/util/checksum.hpp"
#include "utils/number_helper.hpp"

namespace swiftget {

ChunkPlanner::ChunkPlanner(const DownloadSettings& settings, const TransferClient::Headers& headers)
    : settings_(settings.normalized()),
      client_(settings_, headers),
      store_(static_cast<size_t>(settings_.bufferSize)),
      permits_(settings_.maxConcurrentChunks) {}

size_t ChunkPlanner::planChunkCount(uint64_t size, size_t chunkCountOverride) {
    if (chunkCountOverride > 0) return chunkCountOverride;
    uint64_t units = (size + CHUNK_UNIT - 1) / CHUNK_UNIT;
    return static_cast<size_t>(std::clamp<uint64_t>(units, MIN_CHUNKS, MAX_CHUNKS));
}

std::vector<DownloadChunk> ChunkPlanner::partition(uint64_t size, size_t chunkCount, const std::string& basePath) {
    std::vector<DownloadChunk> chunks;
    if (size == 0 || chunkCount == 0) return chunks;
    // Never more chunks than bytes, every range must be non-empty.
    chunkCount = static_cast<size_t>(std::min<uint64_t>(chunkCount, size));

    uint64_t baseSize  = size / chunkCount;
    uint64_t remainder = size % chunkCount;
    uint64_t offset    = 0;
    chunks.reserve(chunkCount);
    for (size_t i = 0; i < chunkCount; i++) {
        uint64_t length = baseSize + (i < remainder ? 1 : 0);
        DownloadChunk chunk(i, offset, offset + length - 1);
        chunk.tempFilePath = FileStore::tempChunkPath(basePath, i);
        chunks.push_back(chunk);
        offset += length;
    }
    return chunks;
}

Status ChunkPlanner::runChunk(const std::string& url, DownloadChunk& chunk, DownloadJob& job,
                              const CancelToken& cancel) {
    chunk.status    = ChunkStatus::DOWNLOADING;
    chunk.startTime = std::chrono::system_clock::now();
    brls::Logger::debug("ChunkPlanner: Chunk {} [{}-{}] starting at +{}", chunk.index, chunk.start, chunk.end,
                        chunk.downloadedBytes);

    auto result = client_.fetchRange(url, chunk.start + chunk.downloadedBytes, chunk.end, chunk.tempFilePath, cancel,
                                     [&chunk, &job](uint64_t delta) {
                                         chunk.downloadedBytes += delta;
                                         job.addDownloadedBytes(delta);
                                     });
    chunk.endTime = std::chrono::system_clock::now();
    if (!result) {
        chunk.status = ChunkStatus::FAILED;
        chunk.error  = result.error().describe();
        if (result.error().kind != ErrorKind::Cancelled) {
            brls::Logger::error("ChunkPlanner: Chunk {} failed: {}", chunk.index, chunk.error);
        }
        return result.error();
    }

    chunk.status = ChunkStatus::COMPLETED;
    brls::Logger::debug("ChunkPlanner: Chunk {} completed ({})", chunk.index, formatFileSize(chunk.size()));
    return {};
}

Status ChunkPlanner::runChunked(const std::string& resourceUrl, const std::string& outputPath, DownloadJob& job,
                                const CancelToken& cancel, size_t chunkCountOverride) {
    auto metadata = client_.probeMetadata(resourceUrl);
    if (!metadata) return metadata.error();
    const uint64_t size = metadata.value().size;
    if (size == 0) {
        return Error{ErrorKind::SizeUnknown, fmt::format("server did not report a content length for {}", resourceUrl)};
    }
    job.setTotalSize(size);

    auto chunks = partition(size, planChunkCount(size, chunkCountOverride), outputPath);
    brls::Logger::info("ChunkPlanner: {} ({}) split into {} chunks, {} in parallel", job.title(),
                       formatFileSize(size), chunks.size(), permits_.capacity());

    // Parts left by a paused attempt are continued only if they came from this very resource.
    const ResumeMarker marker{resourceUrl, size, metadata.value().etag, metadata.value().lastModified, chunks.size()};
    FileStore::reconcilePartials(outputPath, marker, std::max(MAX_CHUNKS, chunks.size()));
    if (auto written = FileStore::writeResumeMarker(outputPath, marker); !written) {
        brls::Logger::warning("ChunkPlanner: {}, a later resume starts over", written.error().message);
    }

    uint64_t resumed = 0;
    for (auto& chunk : chunks) {
        uint64_t existing = FileStore::fileSize(chunk.tempFilePath);
        if (existing > chunk.size()) {
            std::error_code ec;
            std::filesystem::resize_file(chunk.tempFilePath, chunk.size(), ec);
            existing = ec ? 0 : chunk.size();
            if (ec) FileStore::safeDelete(chunk.tempFilePath);
        }
        chunk.downloadedBytes = existing;
        if (chunk.isComplete()) chunk.status = ChunkStatus::COMPLETED;
        resumed += existing;
    }
    job.setDownloadedBytes(resumed);
    job.setResumeOffset(resumed);
    if (resumed > 0) brls::Logger::info("ChunkPlanner: Resuming with {} already on disk", formatFileSize(resumed));

    std::vector<Status> results(chunks.size());
    std::vector<std::thread> workers;
    std::atomic<bool> anyFailed{false};
    for (size_t i = 0; i < chunks.size(); i++) {
        if (chunks[i].isComplete()) continue;
        if (!permits_.acquire(cancel)) break;
        // One failed chunk fails the job, do not start more.
        if (anyFailed.load()) {
            permits_.release();
            break;
        }
        workers.emplace_back([this, i, &chunks, &results, &resourceUrl, &job, &cancel, &anyFailed]() {
            results[i] = runChunk(resourceUrl, chunks[i], job, cancel);
            if (!results[i].ok()) anyFailed.store(true);
            permits_.release();
        });
    }
    for (auto& worker : workers) worker.join();

    if (cancel.isCancelled()) {
        brls::Logger::info("ChunkPlanner: {} cancelled, keeping {} chunk files", job.title(), chunks.size());
        return Error{ErrorKind::Cancelled, "download cancelled"};
    }

    size_t failed             = 0;
    bool onlyProtocol         = true;
    const Error* firstFailure = nullptr;
    for (const auto& result : results) {
        if (result.ok()) continue;
        failed++;
        if (!firstFailure) firstFailure = &result.error();
        if (result.error().kind != ErrorKind::ProtocolViolation) onlyProtocol = false;
    }
    if (failed > 0) {
        return Error{onlyProtocol ? ErrorKind::ProtocolViolation : ErrorKind::PartialFailure,
                     fmt::format("{} of {} chunks failed, first: {}", failed, chunks.size(), firstFailure->message)};
    }

    std::vector<std::string> paths;
    paths.reserve(chunks.size());
    for (const auto& chunk : chunks) paths.push_back(chunk.tempFilePath);

    const std::string staging = FileStore::stagingPath(outputPath);
    if (auto merged = store_.mergeInOrder(paths, staging, cancel); !merged) {
        FileStore::safeDelete(staging);
        return merged;
    }

    if (auto checksum = job.metadataValue(DownloadJob::CHECKSUM_KEY); checksum && !checksum->empty()) {
        if (auto verified = verifyFileDigest(staging, *checksum, cancel); !verified) {
            FileStore::safeDelete(staging);
            if (verified.error().kind == ErrorKind::ChecksumMismatch) {
                FileStore::cleanup(paths);
                FileStore::safeDelete(FileStore::resumeMarkerPath(outputPath));
            }
            return verified;
        }
    }

    if (auto finalized = store_.finalize(staging, outputPath); !finalized) return finalized;
    FileStore::cleanup(paths);
    FileStore::safeDelete(FileStore::resumeMarkerPath(outputPath));

    brls::Logger::info("ChunkPlanner: {} completed ({})", job.title(), formatFileSize(size));
    return {};
}

}  // namespace swiftget
