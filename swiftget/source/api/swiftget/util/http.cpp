#include "swiftget/util/http.hpp"

#include <borealis/core/logger.hpp>
#include <cpr/cpr.h>
#include <curl/curl.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <random>

namespace swiftget {

namespace {

const char* USER_AGENT = "swiftget/1.0";

bool startsWithNoCase(const std::string& text, const std::string& prefix) {
    if (text.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto first     = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

std::optional<uint64_t> parseNumber(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

/// Process wide curl state: global init and the connection/DNS share handle.
class CurlShare {
public:
    static CurlShare& instance() {
        static CurlShare share;
        return share;
    }

    CURLSH* handle() const { return share_; }

private:
    CurlShare() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        share_ = curl_share_init();
        if (!share_) {
            brls::Logger::warning("TransferClient: curl_share_init failed, connections will not be pooled");
            return;
        }
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlShare::lock);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlShare::unlock);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    }

    ~CurlShare() {
        if (share_) curl_share_cleanup(share_);
        curl_global_cleanup();
    }

    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<CurlShare*>(userptr)->mutexes_[data % CURL_LOCK_DATA_LAST].lock();
    }

    static void unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<CurlShare*>(userptr)->mutexes_[data % CURL_LOCK_DATA_LAST].unlock();
    }

    CURLSH* share_ = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> mutexes_;
};

cpr::Header makeCprHeader(const TransferClient::Headers& headers) {
    cpr::Header header{{"User-Agent", USER_AGENT}};
    for (const auto& [key, value] : headers) header[key] = value;
    return header;
}

}  // namespace

std::optional<ContentRange> parseContentRange(const std::string& value) {
    std::string text = trim(value);
    if (!startsWithNoCase(text, "bytes")) return std::nullopt;
    text = trim(text.substr(5));

    auto dash  = text.find('-');
    auto slash = text.find('/');
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) return std::nullopt;

    auto start = parseNumber(trim(text.substr(0, dash)));
    auto end   = parseNumber(trim(text.substr(dash + 1, slash - dash - 1)));
    if (!start || !end || *end < *start) return std::nullopt;

    ContentRange range;
    range.start = *start;
    range.end   = *end;

    std::string total = trim(text.substr(slash + 1));
    if (total != "*") {
        auto parsed = parseNumber(total);
        if (!parsed || *parsed <= range.end) return std::nullopt;
        range.total = parsed;
    }
    return range;
}

std::chrono::milliseconds backoffDelay(int attempt, int baseDelayMs, int maxDelayMs) {
    if (baseDelayMs <= 0) return std::chrono::milliseconds(0);
    int64_t delay = baseDelayMs;
    for (int i = 0; i < attempt && delay < maxDelayMs; i++) delay *= 2;
    return std::chrono::milliseconds(std::min<int64_t>(delay, maxDelayMs));
}

std::chrono::milliseconds backoffJitter(int baseDelayMs) {
    int bound = std::min(std::max(baseDelayMs, 0) / 2, 500);
    if (bound == 0) return std::chrono::milliseconds(0);
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, bound);
    return std::chrono::milliseconds(dist(rng));
}

Error httpStatusError(long status, const std::string& url) {
    if (status >= 500 || status == 408 || status == 429) {
        return Error{ErrorKind::TransientNetwork, fmt::format("HTTP {} from {}", status, url)};
    }
    if (status == 0) {
        return Error{ErrorKind::TransientNetwork, fmt::format("no HTTP response from {}", url)};
    }
    return Error{ErrorKind::ProtocolViolation, fmt::format("unexpected HTTP {} from {}", status, url)};
}

/// One body transfer attempt and the state its curl callbacks share.
struct TransferClient::Request {
    std::string url;
    std::string destination;
    bool ranged         = false;
    uint64_t start      = 0;
    uint64_t end        = 0;
    uint64_t resumeFrom = 0;
    const ProgressCallback* progress = nullptr;
    const CancelToken* token         = nullptr;

    long status = 0;
    std::string contentRange;
    bool validated = false;
    std::optional<Error> failure;
    std::unique_ptr<std::FILE, int (*)(std::FILE*)> file{nullptr, &std::fclose};
    uint64_t base         = 0;  // file length before the first body byte
    uint64_t written      = 0;
    uint64_t reportedHigh = 0;

    uint64_t expected() const { return end - start + 1; }
    uint64_t fileLength() const { return validated ? base + written : resumeFrom; }

    bool openFile(const char* mode) {
        file.reset(std::fopen(destination.c_str(), mode));
        if (!file) {
            failure = Error{ErrorKind::Resource,
                            fmt::format("cannot open {} for writing: {}", destination, std::strerror(errno))};
            return false;
        }
        validated = true;
        return true;
    }

    // Runs once, when the final response's headers are complete.
    bool validate() {
        if (ranged) {
            if (status != 206) {
                failure = status == 200 ? Error{ErrorKind::ProtocolViolation,
                                                fmt::format("server ignored Range {}-{} on {}", start, end, url)}
                                        : httpStatusError(status, url);
                return false;
            }
            auto range = parseContentRange(contentRange);
            if (!range) {
                failure = Error{ErrorKind::ProtocolViolation,
                                fmt::format("missing or malformed Content-Range '{}' from {}", contentRange, url)};
                return false;
            }
            if (range->start != start || range->end != end) {
                failure = Error{ErrorKind::ProtocolViolation,
                                fmt::format("Content-Range {}-{} does not match requested {}-{}", range->start,
                                            range->end, start, end)};
                return false;
            }
            base = 0;
            return openFile("ab");
        }

        if (status == 206 && resumeFrom > 0) {
            auto range = parseContentRange(contentRange);
            if (!range || range->start != resumeFrom) {
                failure = Error{ErrorKind::ProtocolViolation,
                                fmt::format("resume at {} answered with Content-Range '{}'", resumeFrom, contentRange)};
                return false;
            }
            base = resumeFrom;
            return openFile("ab");
        }
        if (status >= 200 && status < 300) {
            if (resumeFrom > 0) brls::Logger::info("TransferClient: Server ignored resume for {}, restarting", url);
            base = 0;
            return openFile("wb");
        }
        failure = httpStatusError(status, url);
        return false;
    }

    static size_t onHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* request = static_cast<Request*>(userdata);
        std::string line(buffer, size * nitems);
        if (startsWithNoCase(line, "HTTP/")) {
            // A new status line starts a new response (redirects, 100-continue).
            request->contentRange.clear();
            auto space = line.find(' ');
            request->status = space == std::string::npos ? 0 : std::strtol(line.c_str() + space + 1, nullptr, 10);
        } else if (startsWithNoCase(line, "Content-Range:")) {
            request->contentRange = trim(line.substr(14));
        }
        return size * nitems;
    }

    static size_t onBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* request = static_cast<Request*>(userdata);
        size_t bytes  = size * nmemb;
        if (request->failure) return 0;
        if (!request->validated && !request->validate()) return 0;
        if (request->token->isCancelled()) return 0;

        uint64_t toWrite = bytes;
        if (request->ranged) toWrite = std::min<uint64_t>(bytes, request->expected() - request->written);
        if (toWrite > 0 && std::fwrite(ptr, 1, toWrite, request->file.get()) != toWrite) {
            request->failure = Error{ErrorKind::Resource, fmt::format("write to {} failed", request->destination)};
            return 0;
        }
        request->written += toWrite;

        // Only bytes past the high-water mark count, so a restarted stream never moves progress back.
        uint64_t length = request->base + request->written;
        if (length > request->reportedHigh) {
            uint64_t delta          = length - request->reportedHigh;
            request->reportedHigh   = length;
            if (*request->progress) (*request->progress)(delta);
        }
        return bytes;
    }

    static int onProgress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        return static_cast<Request*>(clientp)->token->isCancelled() ? 1 : 0;
    }
};

TransferClient::TransferClient(DownloadSettings settings, Headers headers)
    : settings_(settings.normalized()), headers_(std::move(headers)) {
    CurlShare::instance();
}

Result<uint64_t> TransferClient::probeLength(const std::string& url) const {
    auto metadata = probeMetadata(url);
    if (!metadata) return metadata.error();
    if (metadata.value().size == 0) {
        return Error{ErrorKind::SizeUnknown, fmt::format("server did not report a content length for {}", url)};
    }
    return metadata.value().size;
}

bool TransferClient::probeRangeSupport(const std::string& url) const {
    auto metadata = probeMetadata(url);
    return metadata.ok() && metadata.value().supportsRange;
}

Result<ResourceMetadata> TransferClient::probeMetadata(const std::string& url) const {
    cpr::Response r = cpr::Head(cpr::Url{url}, cpr::Timeout{settings_.timeoutSeconds * 1000}, makeCprHeader(headers_));
    if (r.error) {
        brls::Logger::warning("TransferClient: HEAD {} failed: {}", url, r.error.message);
        return Error{ErrorKind::TransientNetwork, fmt::format("HEAD {} failed: {}", url, r.error.message)};
    }
    if (r.status_code < 200 || r.status_code >= 300) {
        return httpStatusError(r.status_code, url);
    }

    ResourceMetadata metadata;
    auto header = [&r](const char* name) -> std::string {
        auto it = r.header.find(name);
        return it == r.header.end() ? std::string{} : trim(it->second);
    };
    metadata.size          = parseNumber(header("Content-Length")).value_or(0);
    metadata.supportsRange = header("Accept-Ranges").find("bytes") != std::string::npos;
    metadata.lastModified  = header("Last-Modified");
    metadata.contentType   = header("Content-Type");
    metadata.etag          = header("ETag");

    brls::Logger::debug("TransferClient: HEAD {} -> size {}, ranges {}, type '{}'", url, metadata.size,
                        metadata.supportsRange, metadata.contentType);
    return metadata;
}

Result<uint64_t> TransferClient::perform(Request& request, const CancelToken& token) const {
    std::unique_ptr<CURL, void (*)(CURL*)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) return Error{ErrorKind::TransientNetwork, "curl_easy_init failed"};

    request.token = &token;

    std::unique_ptr<curl_slist, void (*)(curl_slist*)> headerList(nullptr, &curl_slist_free_all);
    auto appendHeader = [&headerList](const std::string& line) {
        curl_slist* next = curl_slist_append(headerList.get(), line.c_str());
        if (next) {
            headerList.release();
            headerList.reset(next);
        }
    };
    for (const auto& [key, value] : headers_) appendHeader(key + ": " + value);

    std::string range;
    if (request.ranged) {
        range = fmt::format("{}-{}", request.start, request.end);
    } else if (request.resumeFrom > 0) {
        range = fmt::format("{}-", request.resumeFrom);
    }

    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, &Request::onHeader);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &request);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &Request::onBody);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &request);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &Request::onProgress);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &request);
    curl_easy_setopt(handle, CURLOPT_BUFFERSIZE, static_cast<long>(settings_.bufferSize));
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(settings_.timeoutSeconds));
    // Stalled transfers: less than 1 byte/s for the whole timeout.
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, static_cast<long>(settings_.timeoutSeconds));
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXCONNECTS, static_cast<long>(settings_.connectionLimit));
    if (!range.empty()) curl_easy_setopt(handle, CURLOPT_RANGE, range.c_str());

    // Byte offsets must refer to the identity encoding.
    if (request.ranged || request.resumeFrom > 0 || !settings_.enableCompression) {
        curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "identity");
    } else {
        curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    }

    if (settings_.enableConnectionPooling) {
        if (CURLSH* share = CurlShare::instance().handle()) curl_easy_setopt(handle, CURLOPT_SHARE, share);
    } else {
        curl_easy_setopt(handle, CURLOPT_FORBID_REUSE, 1L);
        curl_easy_setopt(handle, CURLOPT_FRESH_CONNECT, 1L);
    }

    CURLcode res = curl_easy_perform(handle);

    // A response without body never reaches onBody.
    if (res == CURLE_OK && !request.validated && !request.failure) {
        if (request.ranged && request.status == 206) {
            request.failure = Error{ErrorKind::TransientNetwork, fmt::format("empty 206 body from {}", request.url)};
        } else {
            request.validate();
        }
    }

    bool flushFailed = request.file && std::fflush(request.file.get()) != 0;
    request.file.reset();

    if (token.isCancelled()) return Error{ErrorKind::Cancelled, fmt::format("transfer of {} cancelled", request.url)};
    if (request.failure) return *request.failure;
    if (flushFailed) return Error{ErrorKind::Resource, fmt::format("flush of {} failed", request.destination)};
    if (res != CURLE_OK) {
        return Error{ErrorKind::TransientNetwork, fmt::format("{}: {}", request.url, curl_easy_strerror(res))};
    }

    if (request.ranged && request.written < request.expected()) {
        return Error{ErrorKind::TransientNetwork,
                     fmt::format("short body from {}: {} of {} bytes", request.url, request.written, request.expected())};
    }
    if (!request.ranged) {
        curl_off_t contentLength = -1;
        curl_easy_getinfo(handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);
        if (contentLength > 0 && request.written < static_cast<uint64_t>(contentLength)) {
            return Error{ErrorKind::TransientNetwork, fmt::format("short body from {}: {} of {} bytes", request.url,
                                                                  request.written, contentLength)};
        }
    }
    return request.written;
}

template <typename Attempt>
Result<uint64_t> TransferClient::withRetry(const std::string& what, const CancelToken& token, Attempt attempt) const {
    for (int tries = 0;; tries++) {
        if (token.isCancelled()) return Error{ErrorKind::Cancelled, fmt::format("{} cancelled", what)};

        Result<uint64_t> result = attempt();
        if (result.ok()) return result;

        const Error& error = result.error();
        if (!error.retryable()) return result;
        if (tries >= settings_.maxRetries) {
            brls::Logger::error("TransferClient: Giving up on {} after {} attempts: {}", what, tries + 1,
                                error.message);
            return result;
        }

        auto delay = backoffDelay(tries, settings_.retryDelayMs, settings_.maxRetryDelayMs) +
                     backoffJitter(settings_.retryDelayMs);
        brls::Logger::warning("TransferClient: {} failed (attempt {}/{}): {}, retrying in {}ms", what, tries + 1,
                              settings_.maxRetries + 1, error.message, delay.count());
        if (token.waitFor(delay)) return Error{ErrorKind::Cancelled, fmt::format("{} cancelled", what)};
    }
}

Result<uint64_t> TransferClient::fetchRange(const std::string& url, uint64_t start, uint64_t end,
                                            const std::string& destinationFile, const CancelToken& token,
                                            const ProgressCallback& progress) const {
    if (end < start) {
        return Error{ErrorKind::ProtocolViolation, fmt::format("invalid range {}-{}", start, end)};
    }

    const uint64_t expected = end - start + 1;
    uint64_t appended       = 0;
    return withRetry(fmt::format("range {}-{} of {}", start, end, url), token, [&]() -> Result<uint64_t> {
        if (appended >= expected) return appended;

        Request request;
        request.url         = url;
        request.destination = destinationFile;
        request.ranged      = true;
        request.start       = start + appended;
        request.end         = end;
        request.progress    = &progress;

        auto result = perform(request, token);
        appended += request.written;
        if (!result) return result.error();
        return appended;
    });
}

Result<uint64_t> TransferClient::fetchStream(const std::string& url, const std::string& destinationFile,
                                             uint64_t resumeFrom, const CancelToken& token,
                                             const ProgressCallback& progress) const {
    uint64_t offset = resumeFrom;
    uint64_t high   = resumeFrom;
    return withRetry(fmt::format("stream {}", url), token, [&]() -> Result<uint64_t> {
        Request request;
        request.url          = url;
        request.destination  = destinationFile;
        request.resumeFrom   = offset;
        request.reportedHigh = high;
        request.progress     = &progress;

        auto result = perform(request, token);
        offset = request.fileLength();
        high   = std::max(high, request.reportedHigh);
        if (!result) return result.error();
        return offset;
    });
}

Result<uint64_t> TransferClient::fetchToFile(const std::string& url, const std::string& destinationFile,
                                             const CancelToken& token, const ProgressCallback& progress) const {
    return fetchStream(url, destinationFile, 0, token, progress);
}

}  // namespace swiftget
