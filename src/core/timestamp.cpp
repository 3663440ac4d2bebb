// timestamp.cpp - Wall-clock formatting helpers
// Part of ignite_build - Ignite Build Orchestrator

#include "core/timestamp.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ignite::build {

namespace {

std::tm to_utc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

std::tm to_local(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

} // namespace

std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    std::tm tm = to_utc(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string compact_local_stamp(std::chrono::system_clock::time_point tp) {
    std::tm tm = to_local(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string display_local_time(std::chrono::system_clock::time_point tp) {
    std::tm tm = to_local(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::chrono::system_clock::time_point file_time_to_system(fs::file_time_type ftime) {
    auto offset = ftime - fs::file_time_type::clock::now();
    return std::chrono::system_clock::now()
        + std::chrono::duration_cast<std::chrono::system_clock::duration>(offset);
}

} // namespace ignite::build
