#include <borealis/core/logger.hpp>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "core/DownloadManager.hpp"
#include "utils/config_helper.hpp"
#include "utils/number_helper.hpp"

using namespace swiftget;

static void printUsage() {
    fmt::print(stderr,
               "usage: " APP_NAME " [-d|-v] [-o log] [-c connections] [-s checksum] [-O output] <url>...\n"
               "  -d              debug logging\n"
               "  -v              verbose logging\n"
               "  -o <file>       write the log to a file\n"
               "  -c <n>          parallel connections per download\n"
               "  -s <hex>        expected MD5 or SHA-256 of the (single) download\n"
               "  -O <path>       output path of the (single) download\n");
}

// Last path segment of the URL, without query or fragment.
static std::string titleFromUrl(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto schemeEnd   = path.find("://");
    if (schemeEnd != std::string::npos) {
        auto slash = path.find('/', schemeEnd + 3);
        path       = slash == std::string::npos ? "" : path.substr(slash);
    }
    while (!path.empty() && path.back() == '/') path.pop_back();
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

int main(int argc, char* argv[]) {
    std::vector<std::string> urls;
    std::string checksum;
    std::string output;
    int connections = 0;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-d") == 0) {
            brls::Logger::setLogLevel(brls::LogLevel::LOG_DEBUG);
        } else if (std::strcmp(argv[i], "-v") == 0) {
            brls::Logger::setLogLevel(brls::LogLevel::LOG_VERBOSE);
        } else if (std::strcmp(argv[i], "-o") == 0) {
            const char* path = (i + 1 < argc) ? argv[++i] : APP_NAME ".log";
            brls::Logger::setLogOutput(std::fopen(path, "w+"));
        } else if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            connections = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-s") == 0 && i + 1 < argc) {
            checksum = argv[++i];
        } else if (std::strcmp(argv[i], "-O") == 0 && i + 1 < argc) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || argv[i][0] == '-') {
            printUsage();
            return std::strcmp(argv[i], "-h") == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
        } else {
            urls.emplace_back(argv[i]);
        }
    }

    if (urls.empty()) {
        printUsage();
        return EXIT_FAILURE;
    }
    if (urls.size() > 1 && (!output.empty() || !checksum.empty())) {
        fmt::print(stderr, "-O and -s apply to a single URL\n");
        return EXIT_FAILURE;
    }

    ProgramConfig::instance().init();
    DownloadSettings settings = ProgramConfig::instance().downloadSettings();
    if (connections > 0) settings.maxConcurrentChunks = connections;

    // One-shot runs are not added to the persisted job list.
    DownloadManager manager(settings);

    std::atomic<int> failures{0};
    manager.subscribeJobEvent([&failures](JobEvent event, JobHandle job) {
        switch (event) {
            case JobEvent::COMPLETED:
                fmt::print("{}: done, {} -> {}\n", job->title(), formatFileSize(job->getTotalSize()),
                           job->outputPath());
                break;
            case JobEvent::FAILED:
                failures++;
                fmt::print(stderr, "{}: failed: {}\n", job->title(), job->getError());
                break;
            case JobEvent::CANCELLED:
                failures++;
                fmt::print(stderr, "{}: cancelled\n", job->title());
                break;
            default:
                break;
        }
    });
    manager.subscribeProgress([](JobHandle job) {
        if (job->getStatus() != DownloadStatus::DOWNLOADING) return;
        fmt::print("{}: {:5.1f}% {} of {}, {}/s, {} left\n", job->title(), job->getProgress(),
                   formatFileSize(job->getDownloadedBytes()), formatFileSize(job->getTotalSize()),
                   formatFileSize(static_cast<uint64_t>(job->getSpeed())), formatDuration(job->getTimeRemaining()));
    });

    for (const auto& url : urls) {
        JobDescriptor descriptor;
        descriptor.sourceUrl = url;
        descriptor.title     = titleFromUrl(url);
        if (!checksum.empty()) descriptor.metadata[DownloadJob::CHECKSUM_KEY] = checksum;
        manager.submit(descriptor, output);
    }

    while (!manager.waitIdle(std::chrono::seconds(1))) {
    }
    manager.stop();

    brls::Logger::info("{} of {} downloads failed", failures.load(), urls.size());
    return failures.load() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
