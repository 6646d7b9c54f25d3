#include "core/FileStore.hpp"

#include <borealis/core/logger.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include "utils/number_helper.hpp"

namespace fs = std::filesystem;
using json     = nlohmann::json;

namespace swiftget {

namespace {

using FilePtr = std::unique_ptr<std::FILE, int (*)(std::FILE*)>;

FilePtr openFile(const std::string& path, const char* mode) { return FilePtr(std::fopen(path.c_str(), mode), &std::fclose); }

std::string existingAncestor(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::absolute(path, ec);
    if (ec) p = path;
    while (!p.empty() && !fs::exists(p, ec)) {
        if (p == p.parent_path()) break;
        p = p.parent_path();
    }
    return p.empty() ? std::string(".") : p.string();
}

}  // namespace

bool operator==(const ResumeMarker& a, const ResumeMarker& b) {
    return a.url == b.url && a.size == b.size && a.etag == b.etag && a.lastModified == b.lastModified &&
           a.chunks == b.chunks;
}

bool operator!=(const ResumeMarker& a, const ResumeMarker& b) { return !(a == b); }

FileStore::FileStore(size_t bufferSize) : bufferSize_(bufferSize > 0 ? bufferSize : 8192) {}

std::string FileStore::tempChunkPath(const std::string& basePath, size_t index) {
    return fmt::format("{}.part{:03d}", basePath, index);
}

std::string FileStore::stagingPath(const std::string& outputPath) { return outputPath + ".merged"; }

std::string FileStore::resumeMarkerPath(const std::string& outputPath) { return outputPath + ".parts.json"; }

std::optional<ResumeMarker> FileStore::readResumeMarker(const std::string& outputPath) {
    const std::string path = resumeMarkerPath(outputPath);
    std::ifstream file(path);
    if (!file) return std::nullopt;

    try {
        json j = json::parse(file);
        ResumeMarker marker;
        marker.url          = j.at("url").get<std::string>();
        marker.size         = j.at("size").get<uint64_t>();
        marker.etag         = j.value("etag", std::string{});
        marker.lastModified = j.value("lastModified", std::string{});
        marker.chunks       = j.value("chunks", size_t{0});
        return marker;
    } catch (const json::exception& e) {
        brls::Logger::warning("FileStore: Ignoring unreadable resume marker {}: {}", path, e.what());
        return std::nullopt;
    }
}

Status FileStore::writeResumeMarker(const std::string& outputPath, const ResumeMarker& marker) {
    json j{
        {"url", marker.url},
        {"size", marker.size},
        {"etag", marker.etag},
        {"lastModified", marker.lastModified},
        {"chunks", marker.chunks},
    };
    const std::string path = resumeMarkerPath(outputPath);
    std::ofstream file(path, std::ios::trunc);
    if (!(file << j.dump(2))) {
        return Error{ErrorKind::Resource, fmt::format("cannot write resume marker {}", path)};
    }
    return {};
}

std::vector<std::string> FileStore::partialFiles(const std::string& outputPath, size_t maxParts) {
    std::vector<std::string> paths;
    for (size_t i = 0; i < maxParts; i++) {
        std::string path = tempChunkPath(outputPath, i);
        if (exists(path)) paths.push_back(path);
    }
    if (exists(stagingPath(outputPath))) paths.push_back(stagingPath(outputPath));
    return paths;
}

void FileStore::removePartials(const std::string& outputPath, size_t maxParts) {
    cleanup(partialFiles(outputPath, maxParts));
    safeDelete(resumeMarkerPath(outputPath));
}

bool FileStore::reconcilePartials(const std::string& outputPath, const ResumeMarker& current, size_t maxParts) {
    auto leftovers = partialFiles(outputPath, maxParts);
    if (leftovers.empty()) return false;

    auto previous = readResumeMarker(outputPath);
    if (previous && *previous == current) return true;

    brls::Logger::warning("FileStore: Discarding {} partial files of {}: {}", leftovers.size(), outputPath,
                          previous ? "the resource changed" : "no resume marker");
    cleanup(leftovers);
    safeDelete(resumeMarkerPath(outputPath));
    return false;
}

Status FileStore::mergeInOrder(const std::vector<std::string>& chunkPaths, const std::string& destination,
                               const CancelToken& token) const {
    // Fail before truncating anything if a chunk is missing.
    for (const auto& chunkPath : chunkPaths) {
        if (!exists(chunkPath)) {
            brls::Logger::error("FileStore: Chunk file not found: {}", chunkPath);
            return Error{ErrorKind::Resource, fmt::format("chunk file not found: {}", chunkPath)};
        }
    }

    auto out = openFile(destination, "wb");
    if (!out) {
        return Error{ErrorKind::Resource,
                     fmt::format("cannot open {} for writing: {}", destination, std::strerror(errno))};
    }

    brls::Logger::info("FileStore: Merging {} chunks into {}", chunkPaths.size(), destination);

    std::unique_ptr<char[]> buffer(new char[bufferSize_]);
    uint64_t merged = 0;
    for (const auto& chunkPath : chunkPaths) {
        if (token.isCancelled()) return Error{ErrorKind::Cancelled, "merge cancelled"};

        auto in = openFile(chunkPath, "rb");
        if (!in) {
            return Error{ErrorKind::Resource, fmt::format("cannot open chunk {}: {}", chunkPath, std::strerror(errno))};
        }

        size_t bytesRead;
        while ((bytesRead = std::fread(buffer.get(), 1, bufferSize_, in.get())) > 0) {
            if (std::fwrite(buffer.get(), 1, bytesRead, out.get()) != bytesRead) {
                brls::Logger::error("FileStore: Failed to write to {}, disk might be full", destination);
                return Error{ErrorKind::Resource, fmt::format("write to {} failed", destination)};
            }
            merged += bytesRead;
        }
        if (std::ferror(in.get())) {
            return Error{ErrorKind::Resource, fmt::format("read error on chunk {}", chunkPath)};
        }
    }

    if (std::fflush(out.get()) != 0) {
        return Error{ErrorKind::Resource, fmt::format("flush of {} failed", destination)};
    }
    brls::Logger::debug("FileStore: Merged {} into {}", formatFileSize(merged), destination);
    return {};
}

Status FileStore::finalize(const std::string& stagingPath, const std::string& destinationPath) const {
    if (!exists(stagingPath)) {
        return Error{ErrorKind::Resource, fmt::format("staging file missing: {}", stagingPath)};
    }

    std::error_code ec;
    fs::rename(stagingPath, destinationPath, ec);
    if (!ec) {
        brls::Logger::info("FileStore: Finalized {}", destinationPath);
        return {};
    }

    brls::Logger::warning("FileStore: Atomic replace of {} failed ({}), falling back to delete and move",
                          destinationPath, ec.message());
    fs::remove(destinationPath, ec);
    fs::rename(stagingPath, destinationPath, ec);
    if (ec) {
        // Different filesystems: copy then drop the staging file.
        fs::copy_file(stagingPath, destinationPath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Error{ErrorKind::Resource,
                         fmt::format("cannot move {} to {}: {}", stagingPath, destinationPath, ec.message())};
        }
        safeDelete(stagingPath);
    }
    brls::Logger::info("FileStore: Finalized {}", destinationPath);
    return {};
}

bool FileStore::isLocked(const std::string& path) {
    if (!exists(path)) return false;

    int fd = ::open(path.c_str(), O_RDWR);
    if (fd < 0) {
        return errno == EACCES || errno == EBUSY || errno == ETXTBSY || errno == EPERM;
    }
    bool locked = ::flock(fd, LOCK_EX | LOCK_NB) != 0 && errno == EWOULDBLOCK;
    if (!locked) ::flock(fd, LOCK_UN);
    ::close(fd);
    return locked;
}

std::string FileStore::describeLock(const std::string& path) {
    if (!exists(path)) return "File does not exist";
    if (!isLocked(path)) return "File is accessible";
    return "File is locked by another process. Common causes:\n"
           "- a media player is playing the file\n"
           "- a file manager or indexer is reading the file\n"
           "- an antivirus is scanning the file\n"
           "- another download is writing the same file\n"
           "- the file is open in an editor";
}

Status FileStore::ensureDirectory(const std::string& directory) {
    if (directory.empty()) return {};
    std::error_code ec;
    if (fs::is_directory(directory, ec)) return {};
    brls::Logger::info("FileStore: Creating directory {}", directory);
    fs::create_directories(directory, ec);
    if (ec) {
        brls::Logger::error("FileStore: Failed to create directory {}: {}", directory, ec.message());
        return Error{ErrorKind::Resource, fmt::format("cannot create directory {}: {}", directory, ec.message())};
    }
    return {};
}

Status FileStore::ensureParentDirectory(const std::string& filePath) {
    return ensureDirectory(fs::path(filePath).parent_path().string());
}

uint64_t FileStore::availableSpace(const std::string& path) {
    struct statvfs stat;
    if (statvfs(existingAncestor(path).c_str(), &stat) != 0) return 0;
    return static_cast<uint64_t>(stat.f_bavail) * stat.f_frsize;
}

Status FileStore::checkDiskSpace(const std::string& path, uint64_t requiredBytes) {
    uint64_t freeSpace = availableSpace(path);
    brls::Logger::debug("FileStore: Available space: {}, needed: {}", formatFileSize(freeSpace),
                        formatFileSize(requiredBytes));
    if (freeSpace < requiredBytes) {
        return Error{ErrorKind::Resource, fmt::format("insufficient disk space: need {}, have {}",
                                                      formatFileSize(requiredBytes), formatFileSize(freeSpace))};
    }
    return {};
}

uint64_t FileStore::fileSize(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

bool FileStore::exists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileStore::safeDelete(const std::string& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) brls::Logger::warning("FileStore: Failed to remove {}: {}", path, ec.message());
    return removed && !ec;
}

void FileStore::cleanup(const std::vector<std::string>& paths) {
    size_t removed = 0;
    for (const auto& path : paths) {
        if (safeDelete(path)) removed++;
    }
    if (removed > 0) brls::Logger::debug("FileStore: Removed {} temporary files", removed);
}

}  // namespace swiftget
