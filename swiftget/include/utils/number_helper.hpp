#pragma once

#include <cstdint>
#include <string>

namespace swiftget {

std::string formatFileSize(uint64_t bytes);

std::string formatDuration(int seconds);

}  // namespace swiftget
