#ifndef IGNITE_BUILD_TIMESTAMP_HPP
#define IGNITE_BUILD_TIMESTAMP_HPP

// timestamp.hpp - Wall-clock formatting helpers
// Part of ignite_build - Ignite Build Orchestrator

#include <chrono>
#include <filesystem>
#include <string>

namespace ignite::build {

namespace fs = std::filesystem;

// "2026-10-19T08:15:30Z"
std::string iso8601_utc(std::chrono::system_clock::time_point tp);

// "20261019_081530" in local time (event log file names)
std::string compact_local_stamp(std::chrono::system_clock::time_point tp);

// "2026-10-19 08:15:30" in local time (listings)
std::string display_local_time(std::chrono::system_clock::time_point tp);

// C++17 has no clock_cast; offsets both clocks against "now".
std::chrono::system_clock::time_point file_time_to_system(fs::file_time_type ftime);

} // namespace ignite::build

#endif // IGNITE_BUILD_TIMESTAMP_HPP
