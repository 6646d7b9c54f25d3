#pragma once

#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "core/DownloadJob.hpp"
#include "core/DownloadSettings.hpp"
#include "core/Result.hpp"
#include "swiftget/util/http.hpp"
#include "utils/cancel_token.hpp"

namespace swiftget {

// Turns a landing-page URL into the direct URL of the file.
using HostResolver = std::function<Result<std::string>(const std::string& url, const CancelToken& cancel)>;

// Downloads a job by some other means (a site specific tool, ...).
using ExternalDownloader = std::function<Status(DownloadJob& job, const CancelToken& cancel)>;

struct HostRule {
    std::string hostPattern;  // case-insensitive substring of the URL host
    HostResolver resolver;
};

struct DirectTransfer {};

struct SegmentConcatenation {};

struct ResolvedHostTransfer {
    HostRule rule;
};

struct ExternalDelegate {
    ExternalDownloader delegate;
};

using TransferStrategy = std::variant<DirectTransfer, SegmentConcatenation, ResolvedHostTransfer, ExternalDelegate>;

std::string extractHost(const std::string& url);
bool hostMatches(const std::string& url, const std::string& hostPattern);

/**
 * Picks the strategy for a job. A host rule matching the source URL wins
 * over the declared type, otherwise the type decides.
 */
TransferStrategy selectStrategy(const DownloadJob& job, const std::vector<HostRule>& hostRules,
                                const ExternalDownloader& external = nullptr);

const char* strategyName(const TransferStrategy& strategy);

Status runStrategy(const TransferStrategy& strategy, DownloadJob& job, const DownloadSettings& settings,
                   const CancelToken& cancel);

// Chunked when the server takes ranges and the file is big enough, single stream otherwise.
Status runDirectTransfer(DownloadJob& job, const std::string& url, const DownloadSettings& settings,
                         const CancelToken& cancel);

// Sequential download into the staging file. An earlier partial file is continued only when the server
// takes ranges and its resume marker matches resource.
Status runSingleStream(DownloadJob& job, const std::string& url, const ResourceMetadata& resource,
                       const DownloadSettings& settings, const CancelToken& cancel);

Status runSegmentConcatenation(DownloadJob& job, const DownloadSettings& settings, const CancelToken& cancel);

}  // namespace swiftget
