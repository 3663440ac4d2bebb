// test_metrics_store.cpp - Tests for MetricsStore
// Part of ignite_build - Ignite Build Orchestrator

#include "test_harness.hpp"

#include "core/errors.hpp"
#include "state/metrics_record.hpp"
#include "state/metrics_store.hpp"

#include <cmath>
#include <memory>
#include <thread>

using namespace ignite::build;

static std::unique_ptr<TempDir> fixture;

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

// =============================================================================
// Load Tests
// =============================================================================

void test_load_missing() {
    MetricsStore store(fixture->path / "missing");
    ASSERT(store.load() == LoadStatus::MISSING);
    ASSERT(store.last_load_status() == LoadStatus::MISSING);
    ASSERT(store.snapshot() == HistoricalMetrics{});
}

void test_load_corrupt_moves_file_aside() {
    fs::path dir = fixture->path / "corrupt";
    write_text(dir / MetricsStore::FILE_NAME, "{ \"total_builds\": 4, ");

    MetricsStore store(dir);
    ASSERT(store.load() == LoadStatus::CORRUPT);
    ASSERT(store.snapshot() == HistoricalMetrics{});

    ASSERT(!fs::exists(dir / MetricsStore::FILE_NAME));
    fs::path aside = dir / (std::string(MetricsStore::FILE_NAME) + MetricsStore::CORRUPT_SUFFIX);
    ASSERT(fs::exists(aside));
    ASSERT_EQ(read_text(aside), std::string("{ \"total_builds\": 4, "));
}

void test_load_empty_file_is_corrupt() {
    fs::path dir = fixture->path / "empty";
    write_text(dir / MetricsStore::FILE_NAME, "");

    MetricsStore store(dir);
    ASSERT(store.load() == LoadStatus::CORRUPT);
}

void test_load_wrong_types_is_corrupt() {
    fs::path dir = fixture->path / "wrong_types";
    write_text(dir / MetricsStore::FILE_NAME, "{\"total_builds\": \"three\"}");

    MetricsStore store(dir);
    ASSERT(store.load() == LoadStatus::CORRUPT);
}

void test_load_ignores_unknown_keys() {
    fs::path dir = fixture->path / "unknown_keys";
    write_text(dir / MetricsStore::FILE_NAME,
               "{\"total_builds\": 2, \"schema\": \"v1\", \"tags\": [1, 2],"
               " \"build_times\": [1.5, 2.5], \"last_success\": null}");

    MetricsStore store(dir);
    ASSERT(store.load() == LoadStatus::LOADED);

    HistoricalMetrics m = store.snapshot();
    ASSERT_EQ(m.total_builds, 2ULL);
    ASSERT_EQ(m.build_times.size(), size_t(2));
    ASSERT(!m.last_success.has_value());
}

// =============================================================================
// Save Tests
// =============================================================================

void test_save_and_reload() {
    fs::path dir = fixture->path / "roundtrip" / "nested";

    HistoricalMetrics expected;
    {
        MetricsStore store(dir);
        store.load();
        store.record_build(12.25);
        store.record_build(0.1);
        store.record_test(3.0);
        store.record_error();
        ASSERT(store.save());
        expected = store.snapshot();
    }

    ASSERT(expected.last_success.has_value());

    MetricsStore reloaded(dir);
    ASSERT(reloaded.load() == LoadStatus::LOADED);
    ASSERT(reloaded.snapshot() == expected);
}

void test_save_leaves_no_temp_file() {
    fs::path dir = fixture->path / "atomic";

    MetricsStore store(dir);
    store.record_test(1.0);
    ASSERT(store.save());
    ASSERT(store.save());

    ASSERT(fs::exists(dir / MetricsStore::FILE_NAME));
    ASSERT(!fs::exists(dir / (std::string(MetricsStore::FILE_NAME) + MetricsStore::TEMP_SUFFIX)));
}

void test_save_fails_on_blocked_directory() {
    // A regular file where the state directory should be
    fs::path blocker = fixture->path / "blocked";
    write_text(blocker, "not a directory");

    MetricsStore store(blocker / "state");
    store.record_error();
    ASSERT(!store.save());
}

void test_serialize_null_last_success() {
    HistoricalMetrics m;
    std::string json = MetricsStore::serialize(m);
    ASSERT(json.find("\"last_success\": null") != std::string::npos);
    ASSERT(MetricsStore::deserialize(json) == m);
}

void test_deserialize_rejects_negative_counter() {
    ASSERT_THROWS(MetricsStore::deserialize("{\"total_errors\": -1}"), CorruptStateError);
}

void test_deserialize_rejects_trailing_content() {
    ASSERT_THROWS(MetricsStore::deserialize("{} {}"), CorruptStateError);
}

// =============================================================================
// Query Tests
// =============================================================================

void test_rolling_average_empty() {
    MetricsStore store(fixture->path / "avg_empty");
    ASSERT(!store.rolling_average(DurationKind::BUILD, 5).has_value());
    ASSERT(!store.rolling_average(DurationKind::TEST, 5).has_value());
}

void test_rolling_average_last_n() {
    MetricsStore store(fixture->path / "avg");
    for (double d : {100.0, 1.0, 2.0, 3.0, 4.0, 5.0}) {
        store.record_build(d);
    }

    auto avg = store.rolling_average(DurationKind::BUILD, 5);
    ASSERT(avg.has_value());
    ASSERT(near(*avg, 3.0));

    auto all = store.rolling_average(DurationKind::BUILD, 50);
    ASSERT(all.has_value());
    ASSERT(near(*all, 115.0 / 6.0));

    ASSERT(!store.rolling_average(DurationKind::BUILD, 0).has_value());
    ASSERT(!store.rolling_average(DurationKind::TEST, 5).has_value());
}

void test_counters() {
    MetricsStore store(fixture->path / "counters");
    store.record_build(1.0);
    store.record_test(2.0);
    store.record_test(4.0);
    store.record_error();
    store.record_error();
    store.record_error();

    HistoricalMetrics m = store.snapshot();
    ASSERT_EQ(m.total_builds, 1ULL);
    ASSERT_EQ(m.total_tests, 2ULL);
    ASSERT_EQ(m.total_errors, 3ULL);
    ASSERT_EQ(m.test_times.size(), size_t(2));
}

void test_concurrent_updates() {
    MetricsStore store(fixture->path / "concurrent");

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&store]() {
            for (int j = 0; j < 100; ++j) {
                store.record_error();
                store.record_test(0.5);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    HistoricalMetrics m = store.snapshot();
    ASSERT_EQ(m.total_errors, 800ULL);
    ASSERT_EQ(m.test_times.size(), size_t(800));
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== MetricsStore Test Suite ===\n\n";

    fixture = std::make_unique<TempDir>("metrics");

    std::cout << "Load Tests:\n";
    TEST(load_missing);
    TEST(load_corrupt_moves_file_aside);
    TEST(load_empty_file_is_corrupt);
    TEST(load_wrong_types_is_corrupt);
    TEST(load_ignores_unknown_keys);

    std::cout << "\nSave Tests:\n";
    TEST(save_and_reload);
    TEST(save_leaves_no_temp_file);
    TEST(save_fails_on_blocked_directory);
    TEST(serialize_null_last_success);
    TEST(deserialize_rejects_negative_counter);
    TEST(deserialize_rejects_trailing_content);

    std::cout << "\nQuery Tests:\n";
    TEST(rolling_average_empty);
    TEST(rolling_average_last_n);
    TEST(counters);
    TEST(concurrent_updates);

    fixture.reset();

    TEST_SUMMARY();
    return (tests_passed == tests_run) ? 0 : 1;
}
