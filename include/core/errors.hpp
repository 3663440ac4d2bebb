#ifndef IGNITE_BUILD_ERRORS_HPP
#define IGNITE_BUILD_ERRORS_HPP

// errors.hpp - Error taxonomy for ignite_build
// Part of ignite_build - Ignite Build Orchestrator
//
// Exceptions cover failures that abort a step (spawn failure, cancellation,
// unusable state storage, staging failure). Non-zero exits and missing
// optional tools are ordinary outcomes and are reported through ErrorKind.

#include <chrono>
#include <stdexcept>
#include <string>

namespace ignite::build {

// Failure category attached to every structured action outcome
enum class ErrorKind {
    NONE,
    EXECUTION,          // Process could not be spawned
    NON_ZERO_EXIT,      // Process ran and exited non-zero
    TOOL_UNAVAILABLE,   // Optional verification tool missing
    CORRUPT_STATE,      // Metrics/cache storage unparseable
    FILESYSTEM,         // Staging/copy failure
    INTERRUPTED         // User cancelled
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:             return "none";
        case ErrorKind::EXECUTION:        return "execution";
        case ErrorKind::NON_ZERO_EXIT:    return "non_zero_exit";
        case ErrorKind::TOOL_UNAVAILABLE: return "tool_unavailable";
        case ErrorKind::CORRUPT_STATE:    return "corrupt_state";
        case ErrorKind::FILESYSTEM:       return "filesystem";
        case ErrorKind::INTERRUPTED:      return "interrupted";
        default:                          return "unknown";
    }
}

class IgniteError : public std::runtime_error {
public:
    explicit IgniteError(const std::string& message)
        : std::runtime_error(message) {}
};

// The external program could not be started. Not retried.
class ExecutionError : public IgniteError {
public:
    ExecutionError(const std::string& message, std::chrono::milliseconds elapsed)
        : IgniteError(message), elapsed_(elapsed) {}

    std::chrono::milliseconds elapsed() const { return elapsed_; }

private:
    std::chrono::milliseconds elapsed_;
};

// The user cancelled while a child process was running.
class InterruptedError : public IgniteError {
public:
    explicit InterruptedError(const std::string& message)
        : IgniteError(message) {}
};

// Persisted state exists but cannot be parsed.
class CorruptStateError : public IgniteError {
public:
    explicit CorruptStateError(const std::string& message)
        : IgniteError(message) {}
};

// Persisted state cannot be read or written (permissions, I/O).
class StateAccessError : public IgniteError {
public:
    explicit StateAccessError(const std::string& message)
        : IgniteError(message) {}
};

// Copying or creating files in the distribution tree failed.
class FilesystemError : public IgniteError {
public:
    explicit FilesystemError(const std::string& message)
        : IgniteError(message) {}
};

} // namespace ignite::build

#endif // IGNITE_BUILD_ERRORS_HPP
