#ifndef IGNITE_BUILD_METRICS_RECORD_HPP
#define IGNITE_BUILD_METRICS_RECORD_HPP

// metrics_record.hpp - Data structures for session and historical telemetry
// Part of ignite_build - Ignite Build Orchestrator

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ignite::build {

// In-memory counters for one process session. Never persisted.
struct SessionStats {
    uint64_t builds = 0;
    uint64_t tests = 0;
    uint64_t checks = 0;
    uint64_t errors = 0;           // Failed external steps
    uint64_t warnings = 0;         // Classified warning lines
    uint64_t commands_run = 0;
    uint64_t cache_hits = 0;
    uint64_t diagnostics_run = 0;

    std::chrono::system_clock::time_point session_start = std::chrono::system_clock::now();

    std::chrono::seconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now() - session_start);
    }
};

// Cross-session record persisted by MetricsStore
struct HistoricalMetrics {
    uint64_t total_builds = 0;
    uint64_t total_tests = 0;
    uint64_t total_errors = 0;

    std::vector<double> build_times;   // seconds, oldest first
    std::vector<double> test_times;    // seconds, oldest first

    std::optional<std::string> last_success;  // ISO-8601

    bool operator==(const HistoricalMetrics& other) const {
        return total_builds == other.total_builds
            && total_tests == other.total_tests
            && total_errors == other.total_errors
            && build_times == other.build_times
            && test_times == other.test_times
            && last_success == other.last_success;
    }

    bool operator!=(const HistoricalMetrics& other) const {
        return !(*this == other);
    }
};

enum class DurationKind {
    BUILD,
    TEST
};

// Outcome of loading persisted metrics
enum class LoadStatus {
    LOADED,     // File read and parsed
    MISSING,    // No file yet - defaults, not an error
    CORRUPT     // File present but unparseable - defaults, reported
};

inline const char* load_status_to_string(LoadStatus status) {
    switch (status) {
        case LoadStatus::LOADED:  return "loaded";
        case LoadStatus::MISSING: return "missing";
        case LoadStatus::CORRUPT: return "corrupt";
        default:                  return "unknown";
    }
}

} // namespace ignite::build

#endif // IGNITE_BUILD_METRICS_RECORD_HPP
