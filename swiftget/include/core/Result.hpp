#pragma once

#include <string>
#include <utility>
#include <variant>

namespace swiftget {

enum class ErrorKind {
    TransientNetwork,
    ProtocolViolation,
    SizeUnknown,
    Resource,
    ChecksumMismatch,
    Cancelled,
    Unsupported,
    PartialFailure,
};

const char* errorKindName(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::TransientNetwork;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    bool retryable() const { return kind == ErrorKind::TransientNetwork; }
    std::string describe() const;
};

// Value-or-error return type used by every engine operation that can fail.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }
    const Error& error() const { return std::get<Error>(data_); }

    T valueOr(T fallback) const { return ok() ? std::get<T>(data_) : fallback; }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)), failed_(true) {}

    bool ok() const { return !failed_; }
    explicit operator bool() const { return ok(); }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool failed_ = false;
};

using Status = Result<void>;

}  // namespace swiftget
