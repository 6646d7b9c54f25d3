#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <borealis/core/event.hpp>
#include <borealis/core/singleton.hpp>

#include "core/DownloadJob.hpp"
#include "core/DownloadSettings.hpp"
#include "core/TransferStrategy.hpp"
#include "utils/cancel_token.hpp"
#include "utils/permit_pool.hpp"

namespace swiftget {

enum class JobEvent {
    ADDED,
    STARTED,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* jobEventName(JobEvent event);

typedef brls::Event<JobEvent, JobHandle> JobEventHandler;
typedef brls::Event<JobHandle> JobProgressHandler;

/**
 * Owns every job: the pending queue, the running set and the job-level
 * concurrency bound. A dispatcher thread takes jobs from the queue and runs
 * each one on its own worker thread with the strategy selected for it.
 *
 * Lifecycle and progress notifications are delivered on engine threads.
 */
class DownloadManager : public brls::Singleton<DownloadManager> {
public:
    // Settings and state directory from ProgramConfig.
    DownloadManager();
    // An empty stateDirectory disables automatic persistence.
    explicit DownloadManager(const DownloadSettings& settings, std::string stateDirectory = "");
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Queues a new job; never blocks on network I/O.
    JobHandle submit(const JobDescriptor& descriptor, const std::string& explicitOutputPath = "");

    // Moves a pending or paused job to the head of the queue.
    bool startNow(const std::string& id);
    bool pause(const std::string& id);
    bool resume(const std::string& id);
    bool cancel(const std::string& id);
    // Only from Failed, while the job's retry count is below the bound.
    bool retry(const std::string& id);

    // Drops completed, failed and cancelled jobs; returns how many.
    size_t clearFinished();
    void clearAll();

    // Cancels running jobs (they are left Paused), stops dispatching and joins all threads.
    void stop();

    // Blocks until nothing is queued or running. Returns false on timeout.
    bool waitIdle(std::chrono::milliseconds timeout);

    void registerHostResolver(const std::string& hostPattern, HostResolver resolver);
    void setExternalDownloader(ExternalDownloader downloader);

    JobEventHandler::Subscription subscribeJobEvent(const JobEventHandler::Callback& callback);
    void unsubscribeJobEvent(JobEventHandler::Subscription subscription);
    JobProgressHandler::Subscription subscribeProgress(const JobProgressHandler::Callback& callback);
    void unsubscribeProgress(JobProgressHandler::Subscription subscription);

    JobHandle getJob(const std::string& id) const;
    std::vector<JobHandle> getAllJobs() const;
    size_t pendingCount() const;
    size_t activeCount() const;
    size_t totalCount() const;

    DownloadSettings settings() const;
    // Affects jobs dispatched from now on; the job concurrency bound is fixed.
    void updateSettings(const DownloadSettings& settings);

    // downloads.json in the state directory.
    bool saveJobs() const;
    size_t loadJobs();
    std::string getStateDirectory() const { return stateDirectory_; }
    std::string getDownloadDirectory() const;

    static std::string sanitizeFileName(const std::string& name);

private:
    struct ActiveJob {
        JobHandle job;
        CancelToken cancel;
        std::shared_ptr<std::atomic<bool>> permitHeld;
    };

    struct Worker {
        std::thread thread;
        std::shared_future<void> done;
    };

    void dispatchLoop();
    void progressLoop();
    void launch(const JobHandle& job);
    void runJob(JobHandle job, CancelToken cancel, std::shared_ptr<std::atomic<bool>> permitHeld,
                std::shared_future<void> previous, TransferStrategy strategy, DownloadSettings settings,
                std::promise<void> done);
    void finishJob(const JobHandle& job, const std::shared_ptr<std::atomic<bool>>& permitHeld, const Status& result);
    void releasePermit(const std::shared_ptr<std::atomic<bool>>& permitHeld);
    void reapWorkers();
    void removeFromQueue(const std::string& id);
    void cleanupJobFiles(const DownloadJob& job) const;
    void autoSave() const;

    void fireJobEvent(JobEvent event, const JobHandle& job);
    void fireProgress(const JobHandle& job);

    JobHandle findJob(const std::string& id) const;
    std::string generateJobId() const;
    std::string generateOutputPath(const JobDescriptor& descriptor, const std::string& id) const;
    std::string getJobsStatePath() const;
    std::string downloadDirectoryLocked() const;

    DownloadSettings settings_;
    const std::string stateDirectory_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::vector<JobHandle> jobs_;
    std::deque<std::string> queue_;
    std::map<std::string, ActiveJob> active_;
    std::map<std::string, std::shared_future<void>> lastRun_;
    std::vector<Worker> workers_;
    std::vector<HostRule> hostRules_;
    ExternalDownloader externalDownloader_;
    int finishing_ = 0;
    bool stopping_ = false;

    PermitPool jobPermits_;
    CancelToken dispatchCancel_;
    std::thread dispatcher_;
    std::thread progressMonitor_;

    std::mutex eventMutex_;
    JobEventHandler jobEvent_;
    JobProgressHandler progressEvent_;

    mutable std::mutex saveMutex_;
};

}  // namespace swiftget
