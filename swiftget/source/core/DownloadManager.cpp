#include "core/DownloadManager.hpp"

#include <borealis/core/logger.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <sstream>

#include "core/ChunkPlanner.hpp"
#include "core/FileStore.hpp"
#include "utils/config_helper.hpp"

using json = nlohmann::json;

namespace swiftget {

namespace {

constexpr auto PROGRESS_INTERVAL = std::chrono::milliseconds(250);

DownloadType typeFromName(const std::string& name) {
    if (name == typeName(DownloadType::SEGMENTED)) return DownloadType::SEGMENTED;
    if (name == typeName(DownloadType::EXTERNAL)) return DownloadType::EXTERNAL;
    return DownloadType::DIRECT;
}

std::optional<DownloadStatus> statusFromValue(int value) {
    if (value < static_cast<int>(DownloadStatus::PENDING) || value > static_cast<int>(DownloadStatus::CANCELLED)) {
        return std::nullopt;
    }
    return static_cast<DownloadStatus>(value);
}

bool isFinished(DownloadStatus status) {
    return status == DownloadStatus::COMPLETED || status == DownloadStatus::FAILED ||
           status == DownloadStatus::CANCELLED;
}

json jobToJson(const DownloadJob& job) {
    json item;
    item["id"]             = job.id();
    item["title"]          = job.title();
    item["url"]            = job.sourceUrl();
    item["localPath"]      = job.outputPath();
    item["type"]           = typeName(job.type());
    item["status"]         = static_cast<int>(job.getStatus());
    item["totalSize"]      = job.getTotalSize();
    item["downloadedSize"] = job.getDownloadedBytes();
    item["retryCount"]     = job.getRetryCount();
    item["maxRetries"]     = job.getMaxRetries();
    item["error"]          = job.getError();
    item["metadata"]       = job.metadata();
    item["segmentUrls"]    = job.segmentUrls();
    item["headers"]        = job.headers();
    return item;
}

JobHandle jobFromJson(const json& item) {
    JobDescriptor descriptor;
    descriptor.sourceUrl    = item.at("url").get<std::string>();
    descriptor.title        = item.value("title", std::string{});
    descriptor.type         = typeFromName(item.value("type", std::string{"direct"}));
    descriptor.expectedSize = item.value("totalSize", uint64_t{0});
    descriptor.segmentUrls  = item.value("segmentUrls", std::vector<std::string>{});
    descriptor.metadata     = item.value("metadata", std::map<std::string, std::string>{});
    descriptor.headers      = item.value("headers", std::map<std::string, std::string>{});

    auto job = std::make_shared<DownloadJob>(item.at("id").get<std::string>(), descriptor,
                                             item.at("localPath").get<std::string>(), item.value("maxRetries", 3));
    int value   = item.value("status", 0);
    auto status = statusFromValue(value);
    if (!status) {
        brls::Logger::warning("DownloadManager: Skipping download {} with unknown status {}", job->id(), value);
        return nullptr;
    }
    job->setStatus(*status);
    job->setDownloadedBytes(item.value("downloadedSize", uint64_t{0}));
    job->setRetryCount(item.value("retryCount", 0));
    job->setError(item.value("error", std::string{}));
    return job;
}

}  // namespace

const char* jobEventName(JobEvent event) {
    switch (event) {
        case JobEvent::ADDED:
            return "Added";
        case JobEvent::STARTED:
            return "Started";
        case JobEvent::COMPLETED:
            return "Completed";
        case JobEvent::FAILED:
            return "Failed";
        case JobEvent::CANCELLED:
            return "Cancelled";
    }
    return "Unknown";
}

DownloadManager::DownloadManager()
    : DownloadManager(ProgramConfig::instance().downloadSettings(), ProgramConfig::instance().getConfigDir()) {}

DownloadManager::DownloadManager(const DownloadSettings& settings, std::string stateDirectory)
    : settings_(settings.normalized()),
      stateDirectory_(std::move(stateDirectory)),
      jobPermits_(settings_.maxConcurrentJobs) {
    brls::Logger::info("DownloadManager: {} jobs x {} chunks in parallel, downloads go to {}",
                       settings_.maxConcurrentJobs, settings_.maxConcurrentChunks, getDownloadDirectory());
    dispatcher_      = std::thread(&DownloadManager::dispatchLoop, this);
    progressMonitor_ = std::thread(&DownloadManager::progressLoop, this);
}

DownloadManager::~DownloadManager() {
    brls::Logger::debug("DownloadManager: Starting destruction");
    stop();
}

JobHandle DownloadManager::submit(const JobDescriptor& descriptor, const std::string& explicitOutputPath) {
    JobHandle job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string id   = generateJobId();
        std::string path = explicitOutputPath.empty() ? generateOutputPath(descriptor, id) : explicitOutputPath;
        job              = std::make_shared<DownloadJob>(id, descriptor, path, settings_.maxJobRetries);
        jobs_.push_back(job);
        queue_.push_back(id);
        if (stopping_) brls::Logger::warning("DownloadManager: Job {} queued on a stopped manager", id);
    }
    brls::Logger::info("DownloadManager: Queued {} '{}' -> {}", job->id(), job->title(), job->outputPath());

    fireJobEvent(JobEvent::ADDED, job);
    cv_.notify_all();
    autoSave();
    return job;
}

bool DownloadManager::startNow(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        JobHandle job = findJob(id);
        if (!job) return false;

        DownloadStatus status = job->getStatus();
        if (status != DownloadStatus::PENDING && status != DownloadStatus::PAUSED) return false;
        if (status == DownloadStatus::PAUSED) job->markPending();
        removeFromQueue(id);
        queue_.push_front(id);
    }
    brls::Logger::info("DownloadManager: Job {} moved to the head of the queue", id);
    cv_.notify_all();
    return true;
}

bool DownloadManager::pause(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        JobHandle job = findJob(id);
        if (!job) return false;

        auto it = active_.find(id);
        if (it != active_.end()) {
            job->markPaused();
            it->second.cancel.cancel();
            releasePermit(it->second.permitHeld);
            active_.erase(it);
        } else if (job->getStatus() == DownloadStatus::PENDING) {
            removeFromQueue(id);
            job->markPaused();
        } else {
            return false;
        }
    }
    brls::Logger::info("DownloadManager: Paused {}", id);
    idleCv_.notify_all();
    autoSave();
    return true;
}

bool DownloadManager::resume(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        JobHandle job = findJob(id);
        if (!job || job->getStatus() != DownloadStatus::PAUSED) return false;
        job->markPending();
        queue_.push_back(id);
    }
    brls::Logger::info("DownloadManager: Resumed {}", id);
    cv_.notify_all();
    autoSave();
    return true;
}

bool DownloadManager::cancel(const std::string& id) {
    JobHandle job;
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = findJob(id);
        if (!job || isFinished(job->getStatus())) return false;

        auto it = active_.find(id);
        if (it != active_.end()) {
            it->second.cancel.cancel();
            releasePermit(it->second.permitHeld);
            active_.erase(it);
        } else {
            removeFromQueue(id);
        }
        job->markCancelled();

        // A worker still winding down removes the files itself when it ends.
        auto last = lastRun_.find(id);
        running   = last != lastRun_.end() && last->second.valid() &&
                  last->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
    }
    if (!running) cleanupJobFiles(*job);

    brls::Logger::info("DownloadManager: Cancelled {}", id);
    fireJobEvent(JobEvent::CANCELLED, job);
    idleCv_.notify_all();
    autoSave();
    return true;
}

bool DownloadManager::retry(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        JobHandle job = findJob(id);
        if (!job) return false;
        if (!job->canRetry()) {
            brls::Logger::warning("DownloadManager: Job {} cannot be retried (status {}, retries {}/{})", id,
                                  statusName(job->getStatus()), job->getRetryCount(), job->getMaxRetries());
            return false;
        }
        job->incrementRetry();
        job->markPending();
        queue_.push_back(id);
        brls::Logger::info("DownloadManager: Retrying {} ({}/{})", id, job->getRetryCount(), job->getMaxRetries());
    }
    cv_.notify_all();
    autoSave();
    return true;
}

size_t DownloadManager::clearFinished() {
    size_t removed = 0;
    std::vector<JobHandle> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::remove_if(jobs_.begin(), jobs_.end(), [this, &leftovers](const JobHandle& job) {
            if (!isFinished(job->getStatus()) || active_.count(job->id())) return false;
            if (job->getStatus() != DownloadStatus::COMPLETED) leftovers.push_back(job);
            lastRun_.erase(job->id());
            return true;
        });
        removed = static_cast<size_t>(std::distance(it, jobs_.end()));
        jobs_.erase(it, jobs_.end());
    }
    // Nothing can resume these jobs any more.
    for (const auto& job : leftovers) cleanupJobFiles(*job);

    brls::Logger::info("DownloadManager: Cleared {} finished jobs", removed);
    autoSave();
    return removed;
}

void DownloadManager::clearAll() {
    std::vector<JobHandle> cancelled;
    std::vector<JobHandle> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : active_) {
            entry.cancel.cancel();
            releasePermit(entry.permitHeld);
        }
        for (const auto& job : jobs_) {
            DownloadStatus status = job->getStatus();
            if (!isFinished(status)) {
                job->markCancelled();
                cancelled.push_back(job);
            }
            // A running worker removes its own files when it ends.
            if (status != DownloadStatus::COMPLETED && !active_.count(job->id())) leftovers.push_back(job);
        }
        active_.clear();
        queue_.clear();
        jobs_.clear();
        lastRun_.clear();
    }
    for (const auto& job : leftovers) cleanupJobFiles(*job);

    brls::Logger::info("DownloadManager: Cleared all jobs, {} cancelled", cancelled.size());
    for (const auto& job : cancelled) fireJobEvent(JobEvent::CANCELLED, job);
    idleCv_.notify_all();
    autoSave();
}

void DownloadManager::stop() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
        for (auto& [id, entry] : active_) {
            entry.job->markPaused();
            entry.cancel.cancel();
            releasePermit(entry.permitHeld);
        }
        active_.clear();
    }
    brls::Logger::info("DownloadManager: Stopping");

    dispatchCancel_.cancel();
    jobPermits_.interrupt();
    cv_.notify_all();
    idleCv_.notify_all();
    if (dispatcher_.joinable()) dispatcher_.join();
    if (progressMonitor_.joinable()) progressMonitor_.join();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) worker.thread.join();
    }
    autoSave();
    brls::Logger::info("DownloadManager: Stopped");
}

bool DownloadManager::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout,
                            [this] { return (queue_.empty() || stopping_) && active_.empty() && finishing_ == 0; });
}

void DownloadManager::registerHostResolver(const std::string& hostPattern, HostResolver resolver) {
    std::lock_guard<std::mutex> lock(mutex_);
    hostRules_.push_back(HostRule{hostPattern, std::move(resolver)});
}

void DownloadManager::setExternalDownloader(ExternalDownloader downloader) {
    std::lock_guard<std::mutex> lock(mutex_);
    externalDownloader_ = std::move(downloader);
}

JobEventHandler::Subscription DownloadManager::subscribeJobEvent(const JobEventHandler::Callback& callback) {
    std::lock_guard<std::mutex> lock(eventMutex_);
    return jobEvent_.subscribe(callback);
}

void DownloadManager::unsubscribeJobEvent(JobEventHandler::Subscription subscription) {
    std::lock_guard<std::mutex> lock(eventMutex_);
    jobEvent_.unsubscribe(subscription);
}

JobProgressHandler::Subscription DownloadManager::subscribeProgress(const JobProgressHandler::Callback& callback) {
    std::lock_guard<std::mutex> lock(eventMutex_);
    return progressEvent_.subscribe(callback);
}

void DownloadManager::unsubscribeProgress(JobProgressHandler::Subscription subscription) {
    std::lock_guard<std::mutex> lock(eventMutex_);
    progressEvent_.unsubscribe(subscription);
}

JobHandle DownloadManager::getJob(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return findJob(id);
}

std::vector<JobHandle> DownloadManager::getAllJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_;
}

size_t DownloadManager::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t DownloadManager::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

size_t DownloadManager::totalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

DownloadSettings DownloadManager::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

void DownloadManager::updateSettings(const DownloadSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings.normalized();
}

std::string DownloadManager::getDownloadDirectory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return downloadDirectoryLocked();
}

std::string DownloadManager::downloadDirectoryLocked() const {
    if (!settings_.downloadDirectory.empty()) return settings_.downloadDirectory;
    return ProgramConfig::defaultDownloadDir();
}

void DownloadManager::dispatchLoop() {
    brls::Logger::debug("DownloadManager: Dispatcher started");
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) break;
        }
        reapWorkers();

        if (!jobPermits_.acquire(dispatchCancel_)) break;

        std::unique_lock<std::mutex> lock(mutex_);
        if (stopping_) {
            lock.unlock();
            jobPermits_.release();
            break;
        }
        JobHandle job;
        while (!queue_.empty() && !job) {
            std::string id = queue_.front();
            queue_.pop_front();
            JobHandle candidate = findJob(id);
            if (candidate && candidate->getStatus() == DownloadStatus::PENDING && !active_.count(id)) {
                job = candidate;
            }
        }
        if (!job) {
            lock.unlock();
            jobPermits_.release();
            idleCv_.notify_all();
            continue;
        }
        launch(job);
    }
    brls::Logger::debug("DownloadManager: Dispatcher exiting");
}

// Called with mutex_ held and one job permit acquired.
void DownloadManager::launch(const JobHandle& job) {
    const std::string& id = job->id();

    ActiveJob entry;
    entry.job        = job;
    entry.permitHeld = std::make_shared<std::atomic<bool>>(true);

    std::promise<void> done;
    std::shared_future<void> finished = done.get_future().share();
    std::shared_future<void> previous;
    if (auto last = lastRun_.find(id); last != lastRun_.end()) previous = last->second;
    lastRun_[id] = finished;

    TransferStrategy strategy = selectStrategy(*job, hostRules_, externalDownloader_);
    job->markStarted();
    active_[id] = entry;

    brls::Logger::info("DownloadManager: Starting {} '{}' as {}", id, job->title(), strategyName(strategy));
    workers_.push_back(Worker{std::thread(&DownloadManager::runJob, this, job, entry.cancel, entry.permitHeld,
                                          previous, std::move(strategy), settings_, std::move(done)),
                              finished});
}

void DownloadManager::runJob(JobHandle job, CancelToken cancel, std::shared_ptr<std::atomic<bool>> permitHeld,
                             std::shared_future<void> previous, TransferStrategy strategy, DownloadSettings settings,
                             std::promise<void> done) {
    // A paused attempt may still be closing its files.
    if (previous.valid()) previous.wait();

    Status result;
    if (cancel.isCancelled()) {
        result = Error{ErrorKind::Cancelled, "cancelled before start"};
    } else {
        fireJobEvent(JobEvent::STARTED, job);
        result = runStrategy(strategy, *job, settings, cancel);
    }
    finishJob(job, permitHeld, result);
    done.set_value();
}

void DownloadManager::finishJob(const JobHandle& job, const std::shared_ptr<std::atomic<bool>>& permitHeld,
                                const Status& result) {
    JobEvent event = JobEvent::COMPLETED;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(job->id());
        if (it == active_.end() || it->second.permitHeld != permitHeld) {
            // Paused, cancelled or stopped while running; that call already updated the job.
            releasePermit(permitHeld);
            if (job->getStatus() == DownloadStatus::CANCELLED) cleanupJobFiles(*job);
            brls::Logger::debug("DownloadManager: Worker for {} ended after {}", job->id(),
                                statusName(job->getStatus()));
            return;
        }
        active_.erase(it);
        // Only after leaving the active set, so the next job never overlaps this one.
        releasePermit(permitHeld);
        finishing_++;

        if (result.ok()) {
            job->markCompleted();
            event = JobEvent::COMPLETED;
        } else if (result.error().kind == ErrorKind::Cancelled) {
            job->markCancelled();
            cleanupJobFiles(*job);
            event = JobEvent::CANCELLED;
        } else {
            job->markFailed(result.error().describe());
            event = JobEvent::FAILED;
        }
    }

    if (event == JobEvent::FAILED) {
        brls::Logger::error("DownloadManager: {} failed: {}", job->id(), job->getError());
    } else {
        brls::Logger::info("DownloadManager: {} {}", job->id(), statusName(job->getStatus()));
    }
    fireProgress(job);
    fireJobEvent(event, job);
    autoSave();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        finishing_--;
    }
    idleCv_.notify_all();
    cv_.notify_all();
}

void DownloadManager::releasePermit(const std::shared_ptr<std::atomic<bool>>& permitHeld) {
    if (permitHeld && permitHeld->exchange(false)) jobPermits_.release();
}

void DownloadManager::reapWorkers() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::partition(workers_.begin(), workers_.end(), [](const Worker& worker) {
            return worker.done.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
        });
        std::move(it, workers_.end(), std::back_inserter(finished));
        workers_.erase(it, workers_.end());
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

void DownloadManager::progressLoop() {
    std::map<std::string, uint64_t> reported;
    while (!dispatchCancel_.waitFor(PROGRESS_INTERVAL)) {
        std::vector<JobHandle> running;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, entry] : active_) running.push_back(entry.job);
        }
        for (const auto& job : running) {
            uint64_t downloaded = job->getDownloadedBytes();
            auto it             = reported.find(job->id());
            if (it != reported.end() && it->second == downloaded) continue;
            reported[job->id()] = downloaded;
            fireProgress(job);
        }
    }
}

void DownloadManager::removeFromQueue(const std::string& id) {
    queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
}

void DownloadManager::cleanupJobFiles(const DownloadJob& job) const {
    FileStore::removePartials(job.outputPath(), std::max(ChunkPlanner::MAX_CHUNKS, job.segmentUrls().size()));
}

void DownloadManager::autoSave() const {
    if (!stateDirectory_.empty()) saveJobs();
}

void DownloadManager::fireJobEvent(JobEvent event, const JobHandle& job) {
    std::lock_guard<std::mutex> lock(eventMutex_);
    try {
        jobEvent_.fire(event, job);
    } catch (const std::exception& e) {
        brls::Logger::error("DownloadManager: Exception in {} handler: {}", jobEventName(event), e.what());
    }
}

void DownloadManager::fireProgress(const JobHandle& job) {
    std::lock_guard<std::mutex> lock(eventMutex_);
    try {
        progressEvent_.fire(job);
    } catch (const std::exception& e) {
        brls::Logger::error("DownloadManager: Exception in progress handler: {}", e.what());
    }
}

JobHandle DownloadManager::findJob(const std::string& id) const {
    auto it = std::find_if(jobs_.begin(), jobs_.end(), [&id](const JobHandle& job) { return job->id() == id; });
    return it == jobs_.end() ? nullptr : *it;
}

std::string DownloadManager::generateJobId() const {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string id;
    int attempts = 0;
    do {
        std::stringstream ss;
        for (int i = 0; i < 16; ++i) ss << std::hex << dis(gen);
        id = ss.str();
        if (++attempts >= 100) {
            auto now = std::chrono::system_clock::now().time_since_epoch();
            id += "_" + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
            break;
        }
    } while (findJob(id));
    return id;
}

std::string DownloadManager::sanitizeFileName(const std::string& name) {
    std::string result = name;
    std::replace_if(
        result.begin(), result.end(),
        [](char c) {
            return c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' ||
                   c == '|' || c == ' ' || (c >= 0 && c < 32);
        },
        '_');
    if (result.length() > 200) result.resize(200);
    if (result == "." || result == "..") result = "_";
    return result;
}

// Called with mutex_ held.
std::string DownloadManager::generateOutputPath(const JobDescriptor& descriptor, const std::string& id) const {
    std::string fileName;
    if (descriptor.title.empty()) {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
        fileName = fmt::format("download_{}", stamp);
    } else {
        fileName = sanitizeFileName(descriptor.title);
    }

    if (!descriptor.fileExtension.empty()) {
        if (descriptor.fileExtension.front() != '.') fileName += '.';
        fileName += descriptor.fileExtension;
    }

    std::string path = (std::filesystem::path(downloadDirectoryLocked()) / fileName).string();
    // Two jobs that may still run must never share an output file; failed jobs can be retried.
    bool taken = std::any_of(jobs_.begin(), jobs_.end(), [&path](const JobHandle& job) {
        DownloadStatus status = job->getStatus();
        return status != DownloadStatus::COMPLETED && status != DownloadStatus::CANCELLED &&
               job->outputPath() == path;
    });
    if (taken) {
        auto dot           = fileName.rfind('.');
        std::string suffix = "_" + id.substr(0, 8);
        fileName           = dot == std::string::npos || dot == 0 ? fileName + suffix
                                                                 : fileName.substr(0, dot) + suffix + fileName.substr(dot);
        path               = (std::filesystem::path(downloadDirectoryLocked()) / fileName).string();
    }
    return path;
}

std::string DownloadManager::getJobsStatePath() const {
    std::string dir = stateDirectory_.empty() ? ProgramConfig::instance().getConfigDir() : stateDirectory_;
    return (std::filesystem::path(dir) / "downloads.json").string();
}

bool DownloadManager::saveJobs() const {
    std::vector<JobHandle> jobs = getAllJobs();
    json j = json::array();
    for (const auto& job : jobs) j.push_back(jobToJson(*job));

    std::lock_guard<std::mutex> lock(saveMutex_);
    const std::string path = getJobsStatePath();
    if (auto dir = FileStore::ensureParentDirectory(path); !dir) {
        brls::Logger::error("DownloadManager: Failed to save downloads state: {}", dir.error().message);
        return false;
    }

    const std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!(file << j.dump(2))) {
            brls::Logger::error("DownloadManager: Failed to write downloads state {}", tmp);
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        brls::Logger::error("DownloadManager: Failed to save downloads state: {}", ec.message());
        return false;
    }
    return true;
}

size_t DownloadManager::loadJobs() {
    const std::string statePath = getJobsStatePath();
    std::ifstream file(statePath);
    if (!file) {
        brls::Logger::info("DownloadManager: No downloads state file found at {}", statePath);
        return 0;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        brls::Logger::error("DownloadManager: Failed to parse downloads state {}: {}", statePath, e.what());
        return 0;
    }
    if (!j.is_array()) {
        brls::Logger::error("DownloadManager: Downloads state {} is not a list", statePath);
        return 0;
    }

    size_t loaded = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& item : j) {
            JobHandle job;
            try {
                job = jobFromJson(item);
            } catch (const json::exception& e) {
                brls::Logger::warning("DownloadManager: Skipping malformed download entry: {}", e.what());
                continue;
            }
            if (!job || findJob(job->id())) continue;

            // Nothing runs right after a load.
            if (job->getStatus() == DownloadStatus::DOWNLOADING) job->markPaused();
            if (job->getStatus() == DownloadStatus::PENDING) queue_.push_back(job->id());
            jobs_.push_back(job);
            loaded++;
        }
    }
    brls::Logger::info("DownloadManager: Loaded {} downloads from state", loaded);
    cv_.notify_all();
    return loaded;
}

}  // namespace swiftget
