#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/Result.hpp"
#include "utils/cancel_token.hpp"

namespace swiftget {

// Identity of the resource a partial download was fetched from, "<output>.parts.json".
struct ResumeMarker {
    std::string url;
    uint64_t size = 0;
    std::string etag;
    std::string lastModified;
    size_t chunks = 0;  // 0 for a single stream staging file
};

bool operator==(const ResumeMarker& a, const ResumeMarker& b);
bool operator!=(const ResumeMarker& a, const ResumeMarker& b);

/**
 * All filesystem access of the engine: temp chunk naming, directory
 * creation, lock detection, ordered merge, disk space queries and the
 * final promotion of the staging file.
 */
class FileStore {
public:
    explicit FileStore(size_t bufferSize = 8192);

    // "<base>.partNNN", zero padded so lexical and numeric order agree.
    static std::string tempChunkPath(const std::string& basePath, size_t index);
    // "<output>.merged"
    static std::string stagingPath(const std::string& outputPath);
    // "<output>.parts.json"
    static std::string resumeMarkerPath(const std::string& outputPath);

    static std::optional<ResumeMarker> readResumeMarker(const std::string& outputPath);
    static Status writeResumeMarker(const std::string& outputPath, const ResumeMarker& marker);

    // Existing part files (index < maxParts) and staging file of outputPath.
    static std::vector<std::string> partialFiles(const std::string& outputPath, size_t maxParts);
    // Deletes the partial files and the resume marker.
    static void removePartials(const std::string& outputPath, size_t maxParts);

    /**
     * Keeps leftovers of an earlier attempt only when its resume marker equals
     * current, otherwise removes them.
     *
     * @return true when partial files are kept and may be continued
     */
    static bool reconcilePartials(const std::string& outputPath, const ResumeMarker& current, size_t maxParts);

    // Appends every chunk file, in the given order, to a fresh destination.
    Status mergeInOrder(const std::vector<std::string>& chunkPaths, const std::string& destination,
                        const CancelToken& token) const;

    // Moves the staging file over the destination, replacing it atomically when possible.
    Status finalize(const std::string& stagingPath, const std::string& destinationPath) const;

    static bool isLocked(const std::string& path);
    static std::string describeLock(const std::string& path);

    static Status ensureDirectory(const std::string& directory);
    static Status ensureParentDirectory(const std::string& filePath);
    static uint64_t availableSpace(const std::string& path);
    static Status checkDiskSpace(const std::string& path, uint64_t requiredBytes);

    static uint64_t fileSize(const std::string& path);
    static bool exists(const std::string& path);
    static bool safeDelete(const std::string& path);
    static void cleanup(const std::vector<std::string>& paths);

    size_t bufferSize() const { return bufferSize_; }

private:
    size_t bufferSize_;
};

}  // namespace swiftget
