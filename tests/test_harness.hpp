// test_harness.hpp - Minimal test macros and fixtures shared by the test suites
// Part of ignite_build - Ignite Build Orchestrator

#ifndef IGNITE_BUILD_TEST_HARNESS_HPP
#define IGNITE_BUILD_TEST_HARNESS_HPP

#include "core/event_log.hpp"
#include "core/output_classifier.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { \
        tests_run++; \
        std::cout << "  Testing: " << #name << "... "; \
        try { \
            test_##name(); \
            tests_passed++; \
            std::cout << "PASS\n"; \
        } catch (const std::exception& e) { \
            std::cout << "FAIL: " << e.what() << "\n"; \
        } \
    } while(0)

#define ASSERT(cond) \
    if (!(cond)) { \
        throw std::runtime_error("Assertion failed: " #cond); \
    }

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) { \
        throw std::runtime_error("Assertion failed: " #a " == " #b); \
    }

#define ASSERT_THROWS(expr, exception_type) \
    do { \
        bool caught_ = false; \
        try { \
            expr; \
        } catch (const exception_type&) { \
            caught_ = true; \
        } \
        if (!caught_) { \
            throw std::runtime_error("Expected " #exception_type " from: " #expr); \
        } \
    } while(0)

#define TEST_SUMMARY() \
    do { \
        std::cout << "\n=== Results ===\n"; \
        std::cout << "Passed: " << tests_passed << "/" << tests_run << "\n"; \
    } while(0)

// =============================================================================
// Test Fixtures
// =============================================================================

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& label) {
        static std::atomic<int> counter{0};
        path = fs::temp_directory_path()
            / ("ignite_build_" + label + "_" + std::to_string(::getpid())
               + "_" + std::to_string(counter++));
        std::error_code ec;
        fs::remove_all(path, ec);
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    fs::path path;
};

inline void write_text(const fs::path& file, const std::string& content) {
    fs::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Executable /bin/sh script standing in for an external tool
inline fs::path write_script(const fs::path& file, const std::string& body) {
    write_text(file, "#!/bin/sh\n" + body);
    ::chmod(file.c_str(), 0755);
    return file;
}

// EventSink keeping every record in memory
class RecordingSink : public ignite::build::EventSink {
public:
    void record(ignite::build::Severity severity, const std::string& message) override {
        records.emplace_back(severity, message);
    }

    bool contains(const std::string& text) const {
        for (const auto& r : records) {
            if (r.second.find(text) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::pair<ignite::build::Severity, std::string>> records;
};

#endif // IGNITE_BUILD_TEST_HARNESS_HPP
