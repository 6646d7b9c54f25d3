#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "core/ChunkPlanner.hpp"
#include "core/DownloadManager.hpp"
#include "core/FileStore.hpp"
#include "test_helpers.hpp"

using namespace swiftget;

namespace {

constexpr auto IDLE_TIMEOUT = std::chrono::seconds(30);

JobDescriptor describe(const std::string& url, const std::string& title = "") {
    JobDescriptor descriptor;
    descriptor.sourceUrl = url;
    descriptor.title     = title;
    return descriptor;
}

// Polls until pred holds or two seconds pass.
template <typename Pred>
bool eventually(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

bool hasPartFiles(const std::string& outputPath) {
    for (size_t i = 0; i < ChunkPlanner::MAX_CHUNKS; i++) {
        if (FileStore::exists(FileStore::tempChunkPath(outputPath, i))) return true;
    }
    return FileStore::exists(FileStore::stagingPath(outputPath)) ||
           FileStore::exists(FileStore::resumeMarkerPath(outputPath));
}

}  // namespace

class DownloadManagerTest : public ::testing::Test {
protected:
    test::RangeResource resource;
    test::TempDir dir;
    test::TestServer server;

    DownloadSettings settings() const {
        DownloadSettings settings   = test::fastSettings();
        settings.downloadDirectory  = dir.path();
        settings.maxJobRetries      = 1;
        return settings;
    }
};

TEST(SanitizeFileNameTest, ReplacesUnsafeCharacters) {
    EXPECT_EQ(DownloadManager::sanitizeFileName("a/b\\c:d*e?f\"g<h>i|j k"), "a_b_c_d_e_f_g_h_i_j_k");
    EXPECT_EQ(DownloadManager::sanitizeFileName(std::string("tab\there")), "tab_here");
    EXPECT_EQ(DownloadManager::sanitizeFileName(".."), "_");
    EXPECT_EQ(DownloadManager::sanitizeFileName(std::string(300, 'x')).size(), 200u);
    EXPECT_EQ(DownloadManager::sanitizeFileName("Movie (2024).mkv"), "Movie_(2024).mkv");
}

TEST(JobEventNameTest, Names) {
    EXPECT_STREQ(jobEventName(JobEvent::ADDED), "Added");
    EXPECT_STREQ(jobEventName(JobEvent::FAILED), "Failed");
}

TEST_F(DownloadManagerTest, CompletedJobFiresLifecycleEvents) {
    resource.payload = test::makePayload(100 * 1024);
    resource.serve(server.server(), "/song.mp3");

    DownloadManager manager(settings());
    std::mutex mutex;
    std::vector<JobEvent> events;
    std::atomic<int> progressCalls{0};
    manager.subscribeJobEvent([&](JobEvent event, JobHandle) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    });
    manager.subscribeProgress([&](JobHandle) { progressCalls++; });

    auto descriptor          = describe(server.url("/song.mp3"), "My Song");
    descriptor.fileExtension = "mp3";
    auto job                 = manager.submit(descriptor);
    EXPECT_EQ(job->outputPath(), dir.file("My_Song.mp3"));
    EXPECT_EQ(job->id().size(), 16u);

    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(job->getStatus(), DownloadStatus::COMPLETED) << job->getError();
    EXPECT_EQ(test::readFile(job->outputPath()), resource.payload);
    EXPECT_DOUBLE_EQ(job->getProgress(), 100.0);
    EXPECT_GE(progressCalls.load(), 1);

    ASSERT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return events.size() == 3;
    }));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(events, (std::vector<JobEvent>{JobEvent::ADDED, JobEvent::STARTED, JobEvent::COMPLETED}));
}

TEST_F(DownloadManagerTest, SameTitleGetsADistinctPath) {
    server.server().Get("/slow", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        res.set_content("x", "text/plain");
    });
    DownloadManager manager(settings());
    auto first  = manager.submit(describe(server.url("/slow"), "clip"));
    auto second = manager.submit(describe(server.url("/slow"), "clip"));
    EXPECT_NE(first->outputPath(), second->outputPath());
    EXPECT_EQ(second->outputPath(), dir.file("clip_" + second->id().substr(0, 8)));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
}

TEST_F(DownloadManagerTest, FailedJobCanBeRetriedUpToTheBound) {
    DownloadManager manager(settings());
    auto job = manager.submit(describe(server.url("/missing.bin"), "missing"));

    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(job->getStatus(), DownloadStatus::FAILED);
    EXPECT_NE(job->getError().find("404"), std::string::npos);

    ASSERT_TRUE(manager.retry(job->id()));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(job->getStatus(), DownloadStatus::FAILED);
    EXPECT_EQ(job->getRetryCount(), 1);

    EXPECT_FALSE(manager.retry(job->id()));
}

TEST_F(DownloadManagerTest, RetryAfterTheServerRecovers) {
    std::atomic<bool> up{false};
    server.server().Get("/later.bin", [&up](const httplib::Request&, httplib::Response& res) {
        if (!up.load()) {
            res.status = 404;
            return;
        }
        res.set_content("recovered", "application/octet-stream");
    });

    DownloadManager manager(settings());
    auto job = manager.submit(describe(server.url("/later.bin"), "later"));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    ASSERT_EQ(job->getStatus(), DownloadStatus::FAILED);

    up.store(true);
    ASSERT_TRUE(manager.retry(job->id()));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(job->getStatus(), DownloadStatus::COMPLETED);
    EXPECT_EQ(test::readFile(job->outputPath()), "recovered");
}

TEST_F(DownloadManagerTest, PauseAndResumeChunkedDownload) {
    resource.payload = test::makePayload(2 * 1024 * 1024);
    resource.serveSlowly(server.server(), "/big.bin", 8 * 1024, std::chrono::milliseconds(20));

    DownloadManager manager(settings());
    auto job = manager.submit(describe(server.url("/big.bin"), "big.bin"));
    ASSERT_TRUE(eventually([&] { return job->getDownloadedBytes() > 0; }));

    ASSERT_TRUE(manager.pause(job->id()));
    EXPECT_EQ(job->getStatus(), DownloadStatus::PAUSED);
    EXPECT_FALSE(manager.pause(job->id()));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(job->getStatus(), DownloadStatus::PAUSED);

    ASSERT_TRUE(manager.resume(job->id()));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(job->getStatus(), DownloadStatus::COMPLETED) << job->getError();
    EXPECT_EQ(test::readFile(job->outputPath()), resource.payload);
    EXPECT_FALSE(hasPartFiles(job->outputPath()));
}

TEST_F(DownloadManagerTest, PauseAndResumeSingleStream) {
    resource.payload = test::makePayload(512 * 1024);
    resource.serveSlowly(server.server(), "/stream.bin", 8 * 1024, std::chrono::milliseconds(20));

    DownloadSettings single     = settings();
    single.chunkThresholdBytes  = 64 * 1024 * 1024;
    DownloadManager manager(single);
    auto job = manager.submit(describe(server.url("/stream.bin"), "stream.bin"));
    ASSERT_TRUE(eventually([&] { return job->getDownloadedBytes() > 0; }));

    ASSERT_TRUE(manager.pause(job->id()));
    uint64_t pausedAt = job->getDownloadedBytes();
    ASSERT_TRUE(manager.resume(job->id()));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(job->getStatus(), DownloadStatus::COMPLETED) << job->getError();
    EXPECT_GE(job->getDownloadedBytes(), pausedAt);
    EXPECT_EQ(test::readFile(job->outputPath()), resource.payload);
    EXPECT_GE(resource.gets.load(), 2);
}

TEST_F(DownloadManagerTest, CancelRemovesPartialFiles) {
    resource.payload = test::makePayload(2 * 1024 * 1024);
    resource.serveSlowly(server.server(), "/cancel.bin", 8 * 1024, std::chrono::milliseconds(20));

    std::mutex mutex;
    std::vector<JobEvent> events;
    DownloadManager manager(settings());
    manager.subscribeJobEvent([&](JobEvent event, JobHandle) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    });
    auto job = manager.submit(describe(server.url("/cancel.bin"), "cancel.bin"));
    ASSERT_TRUE(eventually([&] { return job->getDownloadedBytes() > 0; }));

    ASSERT_TRUE(manager.cancel(job->id()));
    EXPECT_EQ(job->getStatus(), DownloadStatus::CANCELLED);
    EXPECT_FALSE(manager.cancel(job->id()));
    EXPECT_FALSE(manager.resume(job->id()));

    // Joins the winding-down worker.
    manager.stop();
    EXPECT_EQ(job->getStatus(), DownloadStatus::CANCELLED);
    EXPECT_FALSE(hasPartFiles(job->outputPath()));
    EXPECT_FALSE(FileStore::exists(job->outputPath()));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(std::count(events.begin(), events.end(), JobEvent::CANCELLED), 1);
}

TEST_F(DownloadManagerTest, ClearFinishedDropsOnlyFinishedJobs) {
    resource.payload = test::makePayload(4096);
    resource.serve(server.server(), "/a.bin");

    DownloadManager manager(settings());
    manager.submit(describe(server.url("/a.bin"), "a1"));
    manager.submit(describe(server.url("/a.bin"), "a2"));
    manager.submit(describe(server.url("/nope.bin"), "a3"));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(manager.totalCount(), 3u);

    EXPECT_EQ(manager.clearFinished(), 3u);
    EXPECT_EQ(manager.totalCount(), 0u);
    EXPECT_EQ(manager.clearFinished(), 0u);
}

TEST_F(DownloadManagerTest, ClearedFailedJobLeavesNothingForTheNextJob) {
    const std::string first     = test::makePayload(4 * 1024 * 1024, 1);
    const std::string second    = test::makePayload(4 * 1024 * 1024, 2);
    const uint64_t brokenOffset = ChunkPlanner::partition(first.size(), 4, "data")[2].start;
    std::atomic<bool> replaced{false};
    // Until replaced, the third range of the first payload is never served.
    server.server().Get("/data", [&](const httplib::Request& req, httplib::Response& res) {
        bool old = !replaced.load();
        if (old && !req.ranges.empty() && static_cast<uint64_t>(req.ranges.front().first) == brokenOffset) {
            res.status = 503;
            return;
        }
        res.set_header("Accept-Ranges", "bytes");
        res.set_content(old ? first : second, "application/octet-stream");
    });

    DownloadManager manager(settings());
    auto failed = manager.submit(describe(server.url("/data"), "data"));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    ASSERT_EQ(failed->getStatus(), DownloadStatus::FAILED);
    EXPECT_TRUE(FileStore::exists(FileStore::tempChunkPath(failed->outputPath(), 0)));

    EXPECT_EQ(manager.clearFinished(), 1u);
    EXPECT_FALSE(hasPartFiles(failed->outputPath()));

    replaced.store(true);
    auto next = manager.submit(describe(server.url("/data"), "data"));
    EXPECT_EQ(next->outputPath(), failed->outputPath());
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    ASSERT_EQ(next->getStatus(), DownloadStatus::COMPLETED) << next->getError();
    EXPECT_TRUE(test::readFile(next->outputPath()) == second);
    EXPECT_FALSE(hasPartFiles(next->outputPath()));
}

TEST_F(DownloadManagerTest, FailedJobKeepsItsPathUntilCleared) {
    DownloadManager manager(settings());
    auto failed = manager.submit(describe(server.url("/gone.bin"), "dup"));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    ASSERT_EQ(failed->getStatus(), DownloadStatus::FAILED);
    EXPECT_EQ(failed->outputPath(), dir.file("dup"));

    auto second = manager.submit(describe(server.url("/gone.bin"), "dup"));
    EXPECT_EQ(second->outputPath(), dir.file("dup_" + second->id().substr(0, 8)));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));

    manager.clearFinished();
    auto third = manager.submit(describe(server.url("/gone.bin"), "dup"));
    EXPECT_EQ(third->outputPath(), dir.file("dup"));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
}

TEST_F(DownloadManagerTest, ClearAllCancelsEveryUnfinishedJob) {
    resource.payload = test::makePayload(2 * 1024 * 1024);
    resource.serveSlowly(server.server(), "/all.bin", 8 * 1024, std::chrono::milliseconds(20));

    std::mutex mutex;
    std::vector<std::string> cancelled;
    DownloadSettings bounded  = settings();
    bounded.maxConcurrentJobs = 1;
    DownloadManager manager(bounded);
    manager.subscribeJobEvent([&](JobEvent event, JobHandle job) {
        if (event != JobEvent::CANCELLED) return;
        std::lock_guard<std::mutex> lock(mutex);
        cancelled.push_back(job->title());
    });

    auto running = manager.submit(describe(server.url("/all.bin"), "running"));
    ASSERT_TRUE(eventually([&] { return running->getDownloadedBytes() > 0; }));
    auto queued = manager.submit(describe(server.url("/all.bin"), "queued"));
    auto held   = manager.submit(describe(server.url("/all.bin"), "held"));
    ASSERT_TRUE(manager.pause(held->id()));

    manager.clearAll();
    EXPECT_EQ(manager.totalCount(), 0u);
    EXPECT_EQ(manager.pendingCount(), 0u);
    EXPECT_EQ(running->getStatus(), DownloadStatus::CANCELLED);
    EXPECT_EQ(queued->getStatus(), DownloadStatus::CANCELLED);
    EXPECT_EQ(held->getStatus(), DownloadStatus::CANCELLED);

    // Joins the winding-down worker.
    manager.stop();
    EXPECT_FALSE(hasPartFiles(running->outputPath()));

    std::lock_guard<std::mutex> lock(mutex);
    std::sort(cancelled.begin(), cancelled.end());
    EXPECT_EQ(cancelled, (std::vector<std::string>{"held", "queued", "running"}));
}

TEST_F(DownloadManagerTest, JobConcurrencyIsBounded) {
    resource.payload = test::makePayload(64 * 1024);
    resource.serveSlowly(server.server(), "/bounded.bin", 16 * 1024, std::chrono::milliseconds(20));

    DownloadSettings bounded   = settings();
    bounded.maxConcurrentJobs  = 1;
    DownloadManager manager(bounded);

    std::atomic<bool> done{false};
    std::atomic<size_t> maxActive{0};
    std::thread sampler([&]() {
        while (!done.load()) {
            size_t active = manager.activeCount();
            if (active > maxActive.load()) maxActive.store(active);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    std::vector<JobHandle> jobs;
    for (int i = 0; i < 3; i++) {
        jobs.push_back(manager.submit(describe(server.url("/bounded.bin"), fmt::format("b{}", i))));
    }
    bool idle = manager.waitIdle(IDLE_TIMEOUT);
    done.store(true);
    sampler.join();

    ASSERT_TRUE(idle);
    EXPECT_EQ(maxActive.load(), 1u);
    for (const auto& job : jobs) EXPECT_EQ(job->getStatus(), DownloadStatus::COMPLETED);
}

TEST_F(DownloadManagerTest, StartNowJumpsTheQueue) {
    resource.payload = test::makePayload(64 * 1024);
    resource.serveSlowly(server.server(), "/q.bin", 16 * 1024, std::chrono::milliseconds(50));

    DownloadSettings bounded  = settings();
    bounded.maxConcurrentJobs = 1;
    DownloadManager manager(bounded);

    std::mutex mutex;
    std::vector<std::string> started;
    manager.subscribeJobEvent([&](JobEvent event, JobHandle job) {
        if (event != JobEvent::STARTED) return;
        std::lock_guard<std::mutex> lock(mutex);
        started.push_back(job->title());
    });

    auto blocker = manager.submit(describe(server.url("/q.bin"), "blocker"));
    ASSERT_TRUE(eventually([&] { return blocker->getStatus() == DownloadStatus::DOWNLOADING; }));
    manager.submit(describe(server.url("/q.bin"), "second"));
    auto third = manager.submit(describe(server.url("/q.bin"), "third"));
    EXPECT_EQ(manager.pendingCount(), 2u);
    ASSERT_TRUE(manager.startNow(third->id()));

    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(started, (std::vector<std::string>{"blocker", "third", "second"}));
}

TEST_F(DownloadManagerTest, PausedPendingJobIsSkipped) {
    resource.payload = test::makePayload(64 * 1024);
    resource.serveSlowly(server.server(), "/p.bin", 16 * 1024, std::chrono::milliseconds(50));

    DownloadSettings bounded  = settings();
    bounded.maxConcurrentJobs = 1;
    DownloadManager manager(bounded);

    auto blocker = manager.submit(describe(server.url("/p.bin"), "blocker"));
    auto waiting = manager.submit(describe(server.url("/p.bin"), "waiting"));
    ASSERT_TRUE(eventually([&] { return blocker->getStatus() == DownloadStatus::DOWNLOADING; }));
    ASSERT_TRUE(manager.pause(waiting->id()));
    EXPECT_EQ(manager.pendingCount(), 0u);

    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(blocker->getStatus(), DownloadStatus::COMPLETED);
    EXPECT_EQ(waiting->getStatus(), DownloadStatus::PAUSED);

    ASSERT_TRUE(manager.startNow(waiting->id()));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(waiting->getStatus(), DownloadStatus::COMPLETED);
}

TEST_F(DownloadManagerTest, UnknownIdsAreRejected) {
    DownloadManager manager(settings());
    EXPECT_FALSE(manager.pause("nope"));
    EXPECT_FALSE(manager.resume("nope"));
    EXPECT_FALSE(manager.cancel("nope"));
    EXPECT_FALSE(manager.retry("nope"));
    EXPECT_FALSE(manager.startNow("nope"));
    EXPECT_EQ(manager.getJob("nope"), nullptr);
}

TEST_F(DownloadManagerTest, HostResolverIsUsed) {
    resource.payload = test::makePayload(10000);
    resource.serve(server.server(), "/real.bin");
    const std::string direct = server.url("/real.bin");

    std::atomic<int> resolved{0};
    DownloadManager manager(settings());
    manager.registerHostResolver("share.invalid", [&](const std::string&, const CancelToken&) {
        resolved++;
        return Result<std::string>(direct);
    });
    auto job = manager.submit(describe("https://share.invalid/f/123", "shared.bin"));
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(job->getStatus(), DownloadStatus::COMPLETED) << job->getError();
    EXPECT_EQ(resolved.load(), 1);
    EXPECT_EQ(test::readFile(job->outputPath()), resource.payload);
}

TEST_F(DownloadManagerTest, ExternalJobWithoutDownloaderFails) {
    DownloadManager manager(settings());
    auto descriptor = describe("https://video.invalid/watch?v=1", "video");
    descriptor.type = DownloadType::EXTERNAL;
    auto job        = manager.submit(descriptor);
    ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(job->getStatus(), DownloadStatus::FAILED);
    EXPECT_NE(job->getError().find("unsupported"), std::string::npos);
}

TEST_F(DownloadManagerTest, JobsSurviveARestart) {
    resource.payload = test::makePayload(5000);
    resource.serve(server.server(), "/keep.bin");
    const std::string state = dir.file("state");

    std::string completedId;
    {
        DownloadManager manager(settings(), state);
        auto job = manager.submit(describe(server.url("/keep.bin"), "keep"));
        ASSERT_TRUE(manager.waitIdle(IDLE_TIMEOUT));
        ASSERT_EQ(job->getStatus(), DownloadStatus::COMPLETED);
        completedId = job->id();
    }
    ASSERT_TRUE(FileStore::exists(dir.file("state/downloads.json")));

    // An entry that was mid-download when the process died.
    nlohmann::json saved = nlohmann::json::parse(test::readFile(dir.file("state/downloads.json")));
    nlohmann::json interrupted = saved.at(0);
    interrupted["id"]          = "aaaaaaaaaaaaaaaa";
    interrupted["status"]      = static_cast<int>(DownloadStatus::DOWNLOADING);
    interrupted["localPath"]   = dir.file("interrupted.bin");
    saved.push_back(interrupted);
    test::writeFile(dir.file("state/downloads.json"), saved.dump());

    DownloadManager restored(settings(), state);
    EXPECT_EQ(restored.loadJobs(), 2u);
    EXPECT_EQ(restored.loadJobs(), 0u);

    auto completed = restored.getJob(completedId);
    ASSERT_NE(completed, nullptr);
    EXPECT_EQ(completed->getStatus(), DownloadStatus::COMPLETED);
    EXPECT_EQ(completed->title(), "keep");
    EXPECT_EQ(completed->getTotalSize(), resource.payload.size());

    auto paused = restored.getJob("aaaaaaaaaaaaaaaa");
    ASSERT_NE(paused, nullptr);
    EXPECT_EQ(paused->getStatus(), DownloadStatus::PAUSED);
    EXPECT_EQ(restored.pendingCount(), 0u);

    ASSERT_TRUE(restored.resume(paused->id()));
    ASSERT_TRUE(restored.waitIdle(IDLE_TIMEOUT));
    EXPECT_EQ(paused->getStatus(), DownloadStatus::COMPLETED);
    EXPECT_EQ(test::readFile(dir.file("interrupted.bin")), resource.payload);
}

TEST_F(DownloadManagerTest, UnknownStatusInStateFileIsSkipped) {
    const std::string state = dir.file("odd");
    std::filesystem::create_directories(state);
    nlohmann::json saved = nlohmann::json::array();
    saved.push_back({{"id", "1111111111111111"}, {"url", "https://example.com/a"}, {"localPath", dir.file("a")},
                     {"status", static_cast<int>(DownloadStatus::COMPLETED)}});
    saved.push_back({{"id", "2222222222222222"}, {"url", "https://example.com/b"}, {"localPath", dir.file("b")},
                     {"status", 42}});
    saved.push_back({{"id", "3333333333333333"}, {"url", "https://example.com/c"}, {"localPath", dir.file("c")},
                     {"status", -1}});
    test::writeFile(dir.file("odd/downloads.json"), saved.dump());

    DownloadManager manager(settings(), state);
    EXPECT_EQ(manager.loadJobs(), 1u);
    ASSERT_NE(manager.getJob("1111111111111111"), nullptr);
    EXPECT_EQ(manager.getJob("2222222222222222"), nullptr);
    EXPECT_EQ(manager.getJob("3333333333333333"), nullptr);
}

TEST_F(DownloadManagerTest, BrokenStateFileLoadsNothing) {
    const std::string state = dir.file("broken");
    std::filesystem::create_directories(state);
    test::writeFile(dir.file("broken/downloads.json"), "{\"not\": \"a list\"");
    DownloadManager manager(settings(), state);
    EXPECT_EQ(manager.loadJobs(), 0u);
    EXPECT_EQ(manager.totalCount(), 0u);
}
