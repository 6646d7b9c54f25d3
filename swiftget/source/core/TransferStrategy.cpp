#include "core/TransferStrategy.hpp"

#include <borealis/core/logger.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <thread>

#include "core/ChunkPlanner.hpp"
#include "core/FileStore.hpp"
#include "swiftget/util/checksum.hpp"
#include "swiftget/util/http.hpp"
#include "utils/number_helper.hpp"
#include "utils/permit_pool.hpp"

namespace swiftget {

namespace {

const char* CHUNKED_ERROR_KEY = "ChunkedDownloadError";

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Status checkOutputWritable(const std::string& outputPath) {
    if (FileStore::isLocked(outputPath)) {
        brls::Logger::error("Strategy: Output file is locked: {}", outputPath);
        return Error{ErrorKind::Resource,
                     fmt::format("cannot write {}: {}", outputPath, FileStore::describeLock(outputPath))};
    }
    return FileStore::ensureParentDirectory(outputPath);
}

Status verifyAndFinalize(DownloadJob& job, const std::string& staging, const std::string& outputPath,
                         const DownloadSettings& settings, const CancelToken& cancel) {
    if (auto checksum = job.metadataValue(DownloadJob::CHECKSUM_KEY); checksum && !checksum->empty()) {
        if (auto verified = verifyFileDigest(staging, *checksum, cancel); !verified) {
            if (verified.error().kind == ErrorKind::ChecksumMismatch) {
                FileStore::safeDelete(staging);
                FileStore::safeDelete(FileStore::resumeMarkerPath(outputPath));
            }
            return verified;
        }
    }
    if (auto finalized = FileStore(static_cast<size_t>(settings.bufferSize)).finalize(staging, outputPath);
        !finalized) {
        return finalized;
    }
    FileStore::safeDelete(FileStore::resumeMarkerPath(outputPath));
    return {};
}

class StrategyVisitor {
public:
    StrategyVisitor(DownloadJob& job, const DownloadSettings& settings, const CancelToken& cancel)
        : job_(job), settings_(settings), cancel_(cancel) {}

    Status operator()(const DirectTransfer&) const {
        return runDirectTransfer(job_, job_.resourceUrl(), settings_, cancel_);
    }

    Status operator()(const SegmentConcatenation&) const { return runSegmentConcatenation(job_, settings_, cancel_); }

    Status operator()(const ResolvedHostTransfer& strategy) const {
        if (!strategy.rule.resolver) {
            return Error{ErrorKind::Unsupported,
                         fmt::format("no resolver registered for host '{}'", strategy.rule.hostPattern)};
        }
        brls::Logger::info("Strategy: Resolving {} via host rule '{}'", job_.sourceUrl(), strategy.rule.hostPattern);
        auto resolved = strategy.rule.resolver(job_.sourceUrl(), cancel_);
        if (!resolved) return resolved.error();

        brls::Logger::info("Strategy: Resolved direct URL {}", resolved.value());
        job_.setSegmentUrls({resolved.value()});
        return runDirectTransfer(job_, resolved.value(), settings_, cancel_);
    }

    Status operator()(const ExternalDelegate& strategy) const {
        if (!strategy.delegate) {
            return Error{ErrorKind::Unsupported,
                         fmt::format("no external downloader registered for {}", job_.sourceUrl())};
        }
        if (auto ready = FileStore::ensureParentDirectory(job_.outputPath()); !ready) return ready;
        brls::Logger::info("Strategy: Delegating {} to the external downloader", job_.title());
        return strategy.delegate(job_, cancel_);
    }

private:
    DownloadJob& job_;
    const DownloadSettings& settings_;
    const CancelToken& cancel_;
};

}  // namespace

std::string extractHost(const std::string& url) {
    auto schemeEnd = url.find("://");
    size_t start   = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
    size_t end     = url.find_first_of("/?#", start);
    std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);

    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        return toLower(authority.substr(1, close == std::string::npos ? std::string::npos : close - 1));
    }
    auto colon = authority.find(':');
    return toLower(authority.substr(0, colon));
}

bool hostMatches(const std::string& url, const std::string& hostPattern) {
    if (hostPattern.empty()) return false;
    std::string host = extractHost(url);
    return !host.empty() && host.find(toLower(hostPattern)) != std::string::npos;
}

TransferStrategy selectStrategy(const DownloadJob& job, const std::vector<HostRule>& hostRules,
                                const ExternalDownloader& external) {
    const std::string url = job.sourceUrl();
    for (const auto& rule : hostRules) {
        if (hostMatches(url, rule.hostPattern)) return ResolvedHostTransfer{rule};
    }

    switch (job.type()) {
        case DownloadType::SEGMENTED:
            return SegmentConcatenation{};
        case DownloadType::EXTERNAL:
            return ExternalDelegate{external};
        case DownloadType::DIRECT:
        default:
            return DirectTransfer{};
    }
}

const char* strategyName(const TransferStrategy& strategy) {
    switch (strategy.index()) {
        case 0:
            return "direct";
        case 1:
            return "segments";
        case 2:
            return "resolved-host";
        case 3:
            return "external";
        default:
            return "unknown";
    }
}

Status runStrategy(const TransferStrategy& strategy, DownloadJob& job, const DownloadSettings& settings,
                   const CancelToken& cancel) {
    brls::Logger::debug("Strategy: {} runs as {}", job.title(), strategyName(strategy));
    return std::visit(StrategyVisitor(job, settings, cancel), strategy);
}

Status runDirectTransfer(DownloadJob& job, const std::string& url, const DownloadSettings& settings,
                         const CancelToken& cancel) {
    const std::string outputPath = job.outputPath();
    if (auto writable = checkOutputWritable(outputPath); !writable) return writable;

    TransferClient client(settings, job.headers());
    auto metadata = client.probeMetadata(url);
    if (cancel.isCancelled()) return Error{ErrorKind::Cancelled, "download cancelled"};

    ResourceMetadata resource;
    if (metadata) {
        resource = metadata.value();
        if (resource.size > 0) job.setTotalSize(resource.size);
        if (!resource.contentType.empty()) job.setMetadata("ContentType", resource.contentType);
        if (!resource.etag.empty()) job.setMetadata("ETag", resource.etag);
        if (!resource.lastModified.empty()) job.setMetadata("LastModified", resource.lastModified);
    } else {
        brls::Logger::warning("Strategy: Probe of {} failed ({}), using a single stream", url,
                              metadata.error().message);
    }

    const uint64_t size = resource.size;
    if (resource.supportsRange && size > settings.chunkThresholdBytes) {
        // Chunk files plus the merged staging copy live side by side until finalize.
        uint64_t onDisk = std::min(job.getDownloadedBytes(), size);
        if (auto space = FileStore::checkDiskSpace(outputPath, 2 * size - onDisk); !space) return space;

        ChunkPlanner planner(settings, job.headers());
        Status chunked = planner.runChunked(url, outputPath, job, cancel);
        if (chunked.ok() || chunked.error().kind != ErrorKind::ProtocolViolation) return chunked;

        brls::Logger::warning("Strategy: Chunked download of {} failed ({}), falling back to a single stream",
                              job.title(), chunked.error().message);
        job.setMetadata(CHUNKED_ERROR_KEY, chunked.error().message);
        FileStore::removePartials(outputPath, ChunkPlanner::MAX_CHUNKS);
        resource.supportsRange = false;
    }

    return runSingleStream(job, url, resource, settings, cancel);
}

Status runSingleStream(DownloadJob& job, const std::string& url, const ResourceMetadata& resource,
                       const DownloadSettings& settings, const CancelToken& cancel) {
    const std::string outputPath = job.outputPath();
    const std::string staging    = FileStore::stagingPath(outputPath);
    if (auto writable = checkOutputWritable(outputPath); !writable) return writable;

    const ResumeMarker marker{url, resource.size, resource.etag, resource.lastModified, 0};
    bool kept = FileStore::reconcilePartials(outputPath, marker, ChunkPlanner::MAX_CHUNKS);

    const uint64_t total = job.getTotalSize();
    uint64_t resumeFrom  = kept && resource.supportsRange ? FileStore::fileSize(staging) : 0;
    if (total > 0 && resumeFrom > total) {
        FileStore::safeDelete(staging);
        resumeFrom = 0;
    }
    if (resource.supportsRange) {
        if (auto written = FileStore::writeResumeMarker(outputPath, marker); !written) {
            brls::Logger::warning("Strategy: {}, a later resume starts over", written.error().message);
        }
    }
    if (total > 0) {
        if (auto space = FileStore::checkDiskSpace(outputPath, total - resumeFrom); !space) return space;
    }

    if (total == 0 || resumeFrom < total) {
        if (resumeFrom > 0) {
            brls::Logger::info("Strategy: Resuming {} at {}", job.title(), formatFileSize(resumeFrom));
        }
        // The job counter only moves forward, even when the server restarts the body.
        uint64_t length = resumeFrom;
        if (job.getDownloadedBytes() < length) job.setDownloadedBytes(length);
        job.setResumeOffset(job.getDownloadedBytes());
        TransferClient client(settings, job.headers());
        auto fetched = client.fetchStream(url, staging, resumeFrom, cancel, [&job, &length](uint64_t delta) {
            length += delta;
            if (job.getDownloadedBytes() < length) job.setDownloadedBytes(length);
        });
        if (!fetched) return fetched.error();
        if (total == 0) job.setTotalSize(fetched.value());
    }

    if (auto finalized = verifyAndFinalize(job, staging, outputPath, settings, cancel); !finalized) return finalized;
    brls::Logger::info("Strategy: {} completed ({})", job.title(), formatFileSize(FileStore::fileSize(outputPath)));
    return {};
}

Status runSegmentConcatenation(DownloadJob& job, const DownloadSettings& settings, const CancelToken& cancel) {
    const std::vector<std::string> urls = job.segmentUrls();
    if (urls.empty()) {
        return Error{ErrorKind::Unsupported, fmt::format("segmented job {} has no segment URLs", job.title())};
    }

    const std::string outputPath = job.outputPath();
    if (auto writable = checkOutputWritable(outputPath); !writable) return writable;

    brls::Logger::info("Strategy: Fetching {} segments for {}", urls.size(), job.title());

    // Segment sizes are unknown up front, every attempt starts over.
    job.setDownloadedBytes(0);
    job.setResumeOffset(0);
    TransferClient client(settings, job.headers());
    PermitPool permits(settings.normalized().maxConcurrentChunks);

    std::vector<std::string> paths;
    for (size_t i = 0; i < urls.size(); i++) paths.push_back(FileStore::tempChunkPath(outputPath, i));

    std::vector<Status> results(urls.size());
    std::vector<std::thread> workers;
    std::atomic<bool> anyFailed{false};
    for (size_t i = 0; i < urls.size(); i++) {
        if (!permits.acquire(cancel)) break;
        if (anyFailed.load()) {
            permits.release();
            break;
        }
        workers.emplace_back([&, i]() {
            // The expected size is only an estimate here.
            auto fetched = client.fetchToFile(urls[i], paths[i], cancel, [&job](uint64_t delta) {
                job.raiseTotalSize(job.addDownloadedBytes(delta));
            });
            if (!fetched) {
                results[i] = fetched.error();
                anyFailed.store(true);
                if (fetched.error().kind != ErrorKind::Cancelled) {
                    brls::Logger::error("Strategy: Segment {} failed: {}", i, fetched.error().message);
                }
            }
            permits.release();
        });
    }
    for (auto& worker : workers) worker.join();

    if (cancel.isCancelled()) return Error{ErrorKind::Cancelled, "download cancelled"};

    size_t failed = 0;
    std::string firstError;
    for (const auto& result : results) {
        if (result.ok()) continue;
        if (failed++ == 0) firstError = result.error().message;
    }
    if (failed > 0) {
        FileStore::cleanup(paths);
        return Error{ErrorKind::PartialFailure,
                     fmt::format("{} of {} segments failed, first: {}", failed, urls.size(), firstError)};
    }

    const std::string staging = FileStore::stagingPath(outputPath);
    FileStore store(static_cast<size_t>(settings.bufferSize));
    if (auto merged = store.mergeInOrder(paths, staging, cancel); !merged) {
        FileStore::safeDelete(staging);
        return merged;
    }
    FileStore::cleanup(paths);

    job.setTotalSize(FileStore::fileSize(staging));
    if (auto finalized = verifyAndFinalize(job, staging, outputPath, settings, cancel); !finalized) return finalized;
    brls::Logger::info("Strategy: {} completed from {} segments", job.title(), urls.size());
    return {};
}

}  // namespace swiftget
