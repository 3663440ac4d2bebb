// result_cache.cpp - TTL marker cache for expensive prerequisite checks
// Part of ignite_build - Ignite Build Orchestrator

#include "state/result_cache.hpp"
#include "core/errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace ignite::build {

ResultCache::ResultCache(const fs::path& cache_dir, SessionStats& session)
    : cache_dir_(cache_dir)
    , session_(session) {
}

fs::path ResultCache::marker_path(const std::string& key) const {
    if (key.empty() || key == "." || key == ".."
        || key.find('/') != std::string::npos || key.find('\\') != std::string::npos) {
        throw std::invalid_argument("Invalid cache key: '" + key + "'");
    }
    return cache_dir_ / key;
}

bool ResultCache::check(const std::string& key) {
    fs::path marker = marker_path(key);

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    auto touched = fs::last_write_time(marker, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory) {
            spdlog::warn("Cache marker {} unreadable ({}); treating as miss",
                         marker.string(), ec.message());
        }
        return false;
    }

    auto age = fs::file_time_type::clock::now() - touched;
    if (age >= TTL) {
        return false;
    }

    session_.cache_hits++;
    return true;
}

void ResultCache::set(const std::string& key) {
    fs::path marker = marker_path(key);

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (ec) {
        throw StateAccessError("Cannot create cache directory " + cache_dir_.string()
                               + ": " + ec.message());
    }

    if (!fs::exists(marker, ec)) {
        std::ofstream touch(marker, std::ios::binary | std::ios::trunc);
        if (!touch) {
            throw StateAccessError("Cannot create cache marker " + marker.string());
        }
    }

    // Refresh explicitly: an existing marker keeps its old mtime otherwise
    fs::last_write_time(marker, fs::file_time_type::clock::now(), ec);
    if (ec) {
        throw StateAccessError("Cannot touch cache marker " + marker.string()
                               + ": " + ec.message());
    }
}

size_t ResultCache::invalidate_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!fs::is_directory(cache_dir_, ec)) {
        return 0;
    }

    size_t removed = 0;
    for (fs::directory_iterator it(cache_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code remove_ec;
        if (fs::remove(it->path(), remove_ec)) {
            removed++;
        } else if (remove_ec) {
            spdlog::warn("Cannot remove cache marker {}: {}",
                         it->path().string(), remove_ec.message());
        }
    }
    if (ec) {
        spdlog::warn("Cannot list cache directory {}: {}", cache_dir_.string(), ec.message());
    }
    return removed;
}

} // namespace ignite::build
