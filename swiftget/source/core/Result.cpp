#include "core/Result.hpp"

#include <fmt/format.h>

namespace swiftget {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransientNetwork:
            return "network error";
        case ErrorKind::ProtocolViolation:
            return "protocol violation";
        case ErrorKind::SizeUnknown:
            return "size unknown";
        case ErrorKind::Resource:
            return "resource error";
        case ErrorKind::ChecksumMismatch:
            return "checksum mismatch";
        case ErrorKind::Cancelled:
            return "cancelled";
        case ErrorKind::Unsupported:
            return "unsupported";
        case ErrorKind::PartialFailure:
            return "partial failure";
    }
    return "unknown error";
}

std::string Error::describe() const {
    if (message.empty()) return errorKindName(kind);
    return fmt::format("{}: {}", errorKindName(kind), message);
}

}  // namespace swiftget
