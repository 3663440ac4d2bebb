#ifndef IGNITE_BUILD_RESULT_CACHE_HPP
#define IGNITE_BUILD_RESULT_CACHE_HPP

// result_cache.hpp - TTL marker cache for expensive prerequisite checks
// Part of ignite_build - Ignite Build Orchestrator
//
// Each entry is a zero-byte file named after its key; the file's mtime is the
// touch time. An entry is live while now - mtime < TTL. Stale markers are
// logical misses and stay on disk until the next set() refreshes them.
//
// Thread-safe: one mutex serializes every operation

#include "state/metrics_record.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>

namespace ignite::build {

namespace fs = std::filesystem;

class ResultCache {
public:
    static constexpr std::chrono::seconds TTL{3600};

    /**
     * @param cache_dir Directory holding the markers (created lazily)
     * @param session Counters; check() hits increment session.cache_hits
     */
    ResultCache(const fs::path& cache_dir, SessionStats& session);

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    // True iff the marker exists and is younger than TTL
    // @throws std::invalid_argument for empty keys or keys with separators
    bool check(const std::string& key);

    // Create the marker or refresh its touch time
    // @throws StateAccessError if the marker cannot be written
    void set(const std::string& key);

    // Remove every marker. Returns the number removed.
    size_t invalidate_all();

    const fs::path& directory() const { return cache_dir_; }

private:
    fs::path cache_dir_;
    SessionStats& session_;
    mutable std::mutex mutex_;

    fs::path marker_path(const std::string& key) const;
};

} // namespace ignite::build

#endif // IGNITE_BUILD_RESULT_CACHE_HPP
