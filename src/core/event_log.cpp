// event_log.cpp - Durable per-session event log
// Part of ignite_build - Ignite Build Orchestrator

#include "core/event_log.hpp"
#include "core/errors.hpp"
#include "core/timestamp.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace ignite::build {

namespace {

spdlog::level::level_enum to_spdlog_level(Severity severity) {
    switch (severity) {
        case Severity::WARNING: return spdlog::level::warn;
        case Severity::ERROR:   return spdlog::level::err;
        case Severity::INFO:
        default:                return spdlog::level::info;
    }
}

// Logger names must be unique per process when several logs are open (tests)
std::string next_logger_name() {
    static std::atomic<int> counter{0};
    return "ignite_event_log_" + std::to_string(counter.fetch_add(1));
}

// Creates the file exclusively so concurrent sessions never share one.
// Same-second collisions fall back to a pid suffix, then a counter.
fs::path claim_log_path(const fs::path& log_dir, const std::string& stem) {
    const std::string pid = std::to_string(::getpid());

    for (int attempt = 0;; ++attempt) {
        std::string name = stem;
        if (attempt > 0) {
            name += "_" + pid;
        }
        if (attempt > 1) {
            name += "_" + std::to_string(attempt - 1);
        }
        fs::path candidate = log_dir / (name + EventLog::FILE_EXTENSION);

        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd >= 0) {
            ::close(fd);
            return candidate;
        }
        if (errno != EEXIST) {
            throw StateAccessError("Cannot create event log " + candidate.string()
                                   + ": " + std::strerror(errno));
        }
    }
}

} // namespace

EventLog::EventLog(const fs::path& log_dir,
                   std::chrono::system_clock::time_point session_start) {
    std::error_code ec;
    fs::create_directories(log_dir, ec);
    if (ec) {
        throw StateAccessError("Cannot create log directory " + log_dir.string()
                               + ": " + ec.message());
    }

    path_ = claim_log_path(log_dir, std::string(FILE_PREFIX) + compact_local_stamp(session_start));

    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_.string(), false);
        logger_ = std::make_shared<spdlog::logger>(next_logger_name(), std::move(sink));
    } catch (const spdlog::spdlog_ex& e) {
        throw StateAccessError("Cannot open event log " + path_.string() + ": " + e.what());
    }

    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger_->set_level(spdlog::level::trace);
    logger_->flush_on(spdlog::level::trace);
}

EventLog::~EventLog() {
    if (logger_) {
        logger_->flush();
    }
}

void EventLog::record(Severity severity, const std::string& message) {
    logger_->log(to_spdlog_level(severity), "{}", message);
}

void EventLog::flush() {
    logger_->flush();
}

std::vector<LogFileInfo> list_recent_logs(const fs::path& log_dir, size_t limit) {
    std::vector<LogFileInfo> logs;

    std::error_code ec;
    if (!fs::is_directory(log_dir, ec)) {
        return logs;
    }

    for (fs::directory_iterator it(log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry.path().extension() != EventLog::FILE_EXTENSION) {
            continue;
        }

        LogFileInfo info;
        info.name = entry.path().filename().string();
        info.size_bytes = entry.file_size(entry_ec);
        info.modified = file_time_to_system(entry.last_write_time(entry_ec));
        logs.push_back(std::move(info));
    }

    std::sort(logs.begin(), logs.end(), [](const LogFileInfo& a, const LogFileInfo& b) {
        if (a.modified != b.modified) return a.modified > b.modified;
        return a.name > b.name;
    });

    if (logs.size() > limit) {
        logs.resize(limit);
    }
    return logs;
}

} // namespace ignite::build
