#ifndef IGNITE_BUILD_METRICS_STORE_HPP
#define IGNITE_BUILD_METRICS_STORE_HPP

// metrics_store.hpp - Persistent cross-session build metrics
// Part of ignite_build - Ignite Build Orchestrator
//
// Keeps HistoricalMetrics in memory and persists it as a small JSON document:
// - Loaded once at startup, flushed after every completed action
// - Whole-file replacement through a temp file + rename
// - Missing and corrupt files are distinguished (LoadStatus)
//
// Thread-safe: one mutex serializes every operation

#include "state/metrics_record.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace ignite::build {

namespace fs = std::filesystem;

class MetricsStore {
public:
    static constexpr const char* FILE_NAME = "metrics.json";
    static constexpr const char* TEMP_SUFFIX = ".tmp";
    static constexpr const char* CORRUPT_SUFFIX = ".corrupt";

    explicit MetricsStore(const fs::path& state_dir);

    MetricsStore(const MetricsStore&) = delete;
    MetricsStore& operator=(const MetricsStore&) = delete;

    // =========================================================================
    // Persistence
    // =========================================================================

    // Replace in-memory metrics with the persisted record.
    // MISSING and CORRUPT both leave all-zero defaults. A corrupt file is moved
    // aside to <file>.corrupt and a warning is logged.
    // @throws StateAccessError when the file exists but cannot be read
    LoadStatus load();

    // Write current metrics atomically. Returns false (and logs) on failure.
    bool save();

    // =========================================================================
    // Updates
    // =========================================================================

    // Successful build: counter, duration sample and last_success stamp
    void record_build(double duration_seconds);

    void record_test(double duration_seconds);

    // Independent of session error counting
    void record_error();

    // =========================================================================
    // Queries
    // =========================================================================

    // Mean of the most recent n samples; nullopt with no samples or n == 0
    std::optional<double> rolling_average(DurationKind kind, size_t n) const;

    HistoricalMetrics snapshot() const;

    LoadStatus last_load_status() const;

    const fs::path& file_path() const { return file_path_; }

    // =========================================================================
    // Serialization (public for tests)
    // =========================================================================

    static std::string serialize(const HistoricalMetrics& metrics);

    // @throws CorruptStateError on any syntax or schema error
    static HistoricalMetrics deserialize(const std::string& json_str);

private:
    fs::path file_path_;
    HistoricalMetrics metrics_;
    LoadStatus last_load_status_ = LoadStatus::MISSING;

    mutable std::mutex mutex_;
};

} // namespace ignite::build

#endif // IGNITE_BUILD_METRICS_STORE_HPP
