#pragma once

#include <stdexcept>
#include <string>

namespace voxturn {

// Transport-level status of one duplex call.
enum class StatusCode {
    Ok,
    Cancelled,
    Unknown,
    InvalidArgument,
    DeadlineExceeded,
    PermissionDenied,
    Unauthenticated,
    Internal,
    Unavailable
};

inline const char* statusName(StatusCode code) {
    switch (code) {
        case StatusCode::Ok:               return "OK";
        case StatusCode::Cancelled:        return "CANCELLED";
        case StatusCode::Unknown:          return "UNKNOWN";
        case StatusCode::InvalidArgument:  return "INVALID_ARGUMENT";
        case StatusCode::DeadlineExceeded: return "DEADLINE_EXCEEDED";
        case StatusCode::PermissionDenied: return "PERMISSION_DENIED";
        case StatusCode::Unauthenticated:  return "UNAUTHENTICATED";
        case StatusCode::Internal:         return "INTERNAL";
        case StatusCode::Unavailable:      return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

class TransportError : public std::runtime_error {
public:
    TransportError(StatusCode code, const std::string& message)
        : std::runtime_error(std::string(statusName(code)) + ": " + message), code_(code) {}

    StatusCode code() const { return code_; }

private:
    StatusCode code_;
};

// Raised by RetryPolicy once every attempt failed with a retryable error.
class ExhaustedRetries : public std::runtime_error {
public:
    ExhaustedRetries(int attempts, const std::string& last_error)
        : std::runtime_error("gave up after " + std::to_string(attempts) +
                             " attempts, last error: " + last_error),
          attempts_(attempts), last_error_(last_error) {}

    int attempts() const { return attempts_; }
    const std::string& lastError() const { return last_error_; }

private:
    int attempts_;
    std::string last_error_;
};

// Device-action payload that cannot be decoded. Never leaves the dispatcher.
class MalformedDeviceAction : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing or invalid settings detected before the first turn.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace voxturn
