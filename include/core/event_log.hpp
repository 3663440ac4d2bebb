#ifndef IGNITE_BUILD_EVENT_LOG_HPP
#define IGNITE_BUILD_EVENT_LOG_HPP

// event_log.hpp - Durable per-session event log
// Part of ignite_build - Ignite Build Orchestrator
//
// Every line produced by every executed command is appended verbatim, in
// order, with a severity-tagged prefix. Orchestrator milestones go to the
// same log.

#include "core/output_classifier.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace ignite::build {

namespace fs = std::filesystem;

class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void record(Severity severity, const std::string& message) = 0;
    virtual void flush() {}
};

/**
 * EventLog - spdlog-backed append-only session log
 *
 * File: <log_dir>/ignite_YYYYMMDD_HHMMSS.log
 * Line: [2026-10-19 08:15:30.123] [info] <message>
 *
 * Flushes after every record so a crash or interrupt never loses lines that
 * were already reported.
 *
 * @throws StateAccessError if the log directory or file cannot be created
 */
class EventLog : public EventSink {
public:
    static constexpr const char* FILE_PREFIX = "ignite_";
    static constexpr const char* FILE_EXTENSION = ".log";

    EventLog(const fs::path& log_dir,
             std::chrono::system_clock::time_point session_start);
    ~EventLog() override;

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    void record(Severity severity, const std::string& message) override;
    void flush() override;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    std::shared_ptr<spdlog::logger> logger_;
};

struct LogFileInfo {
    std::string name;
    uintmax_t size_bytes = 0;
    std::chrono::system_clock::time_point modified;
};

// Event log files in log_dir, newest first, at most `limit` entries.
// A missing directory yields an empty list.
std::vector<LogFileInfo> list_recent_logs(const fs::path& log_dir, size_t limit = 10);

} // namespace ignite::build

#endif // IGNITE_BUILD_EVENT_LOG_HPP
