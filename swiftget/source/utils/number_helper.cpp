#include "utils/number_helper.hpp"

#include <fmt/format.h>

namespace swiftget {

std::string formatFileSize(uint64_t bytes) {
    const double KB = 1024.0;
    const double MB = KB * 1024.0;
    const double GB = MB * 1024.0;

    if (bytes >= GB) {
        return fmt::format("{:.2f} GB", bytes / GB);
    } else if (bytes >= MB) {
        return fmt::format("{:.1f} MB", bytes / MB);
    } else if (bytes >= KB) {
        return fmt::format("{:.1f} KB", bytes / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string formatDuration(int seconds) {
    if (seconds <= 0) return "--:--";
    int h = seconds / 3600;
    int m = (seconds % 3600) / 60;
    int s = seconds % 60;
    if (h > 0) return fmt::format("{}:{:02d}:{:02d}", h, m, s);
    return fmt::format("{:02d}:{:02d}", m, s);
}

}  // namespace swiftget
