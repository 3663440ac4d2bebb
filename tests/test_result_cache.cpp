// test_result_cache.cpp - Tests for ResultCache
// Part of ignite_build - Ignite Build Orchestrator

#include "test_harness.hpp"

#include "state/metrics_record.hpp"
#include "state/result_cache.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

using namespace ignite::build;

static std::unique_ptr<TempDir> fixture;

static fs::path cache_dir(const std::string& name) {
    return fixture->path / name / "cache";
}

// =============================================================================
// Hit / Miss Tests
// =============================================================================

void test_miss_when_never_set() {
    SessionStats session;
    ResultCache cache(cache_dir("never_set"), session);

    ASSERT(!cache.check("target-x86_64-unknown-uefi"));
    ASSERT_EQ(session.cache_hits, 0ULL);
}

void test_hit_after_set() {
    SessionStats session;
    ResultCache cache(cache_dir("hit"), session);

    cache.set("target-x86_64-unknown-uefi");
    ASSERT(fs::exists(cache.directory() / "target-x86_64-unknown-uefi"));
    ASSERT_EQ(fs::file_size(cache.directory() / "target-x86_64-unknown-uefi"), 0U);

    ASSERT(cache.check("target-x86_64-unknown-uefi"));
    ASSERT(cache.check("target-x86_64-unknown-uefi"));
    ASSERT_EQ(session.cache_hits, 2ULL);
}

void test_keys_are_independent() {
    SessionStats session;
    ResultCache cache(cache_dir("independent"), session);

    cache.set("alpha");
    ASSERT(cache.check("alpha"));
    ASSERT(!cache.check("beta"));
    ASSERT_EQ(session.cache_hits, 1ULL);
}

void test_stale_marker_is_miss() {
    SessionStats session;
    ResultCache cache(cache_dir("stale"), session);

    cache.set("target-x");
    fs::path marker = cache.directory() / "target-x";

    // Back-date past the TTL
    fs::last_write_time(marker, fs::file_time_type::clock::now() - std::chrono::seconds(3601));

    ASSERT(!cache.check("target-x"));
    ASSERT_EQ(session.cache_hits, 0ULL);

    // Stale markers stay until refreshed
    ASSERT(fs::exists(marker));
}

void test_marker_just_inside_ttl_is_hit() {
    SessionStats session;
    ResultCache cache(cache_dir("inside"), session);

    cache.set("target-x");
    fs::last_write_time(cache.directory() / "target-x",
                        fs::file_time_type::clock::now() - std::chrono::seconds(3500));

    ASSERT(cache.check("target-x"));
}

void test_set_refreshes_stale_marker() {
    SessionStats session;
    ResultCache cache(cache_dir("refresh"), session);

    cache.set("target-x");
    fs::last_write_time(cache.directory() / "target-x",
                        fs::file_time_type::clock::now() - std::chrono::hours(5));
    ASSERT(!cache.check("target-x"));

    cache.set("target-x");
    ASSERT(cache.check("target-x"));
}

void test_persists_across_instances() {
    SessionStats first_session;
    {
        ResultCache cache(cache_dir("persist"), first_session);
        cache.set("target-x");
    }

    SessionStats second_session;
    ResultCache cache(cache_dir("persist"), second_session);
    ASSERT(cache.check("target-x"));
    ASSERT_EQ(second_session.cache_hits, 1ULL);
    ASSERT_EQ(first_session.cache_hits, 0ULL);
}

// =============================================================================
// Invalidation Tests
// =============================================================================

void test_invalidate_all() {
    SessionStats session;
    ResultCache cache(cache_dir("invalidate"), session);

    cache.set("a");
    cache.set("b");
    cache.set("c");

    ASSERT_EQ(cache.invalidate_all(), size_t(3));
    ASSERT(!cache.check("a"));
    ASSERT(!cache.check("b"));
    ASSERT_EQ(cache.invalidate_all(), size_t(0));
}

void test_invalidate_skips_unremovable_entries() {
    SessionStats session;
    ResultCache cache(cache_dir("unremovable"), session);

    cache.set("a");
    cache.set("b");
    write_text(cache.directory() / "stray" / "nested", "not a marker");

    // The non-empty directory cannot be removed; the walk goes on without throwing
    ASSERT_EQ(cache.invalidate_all(), size_t(2));
    ASSERT(!cache.check("a"));
    ASSERT(!cache.check("b"));
    ASSERT(fs::exists(cache.directory() / "stray" / "nested"));
}

void test_invalidate_missing_directory() {
    SessionStats session;
    ResultCache cache(cache_dir("no_dir"), session);
    ASSERT_EQ(cache.invalidate_all(), size_t(0));
}

// =============================================================================
// Key Validation Tests
// =============================================================================

void test_invalid_keys_rejected() {
    SessionStats session;
    ResultCache cache(cache_dir("keys"), session);

    ASSERT_THROWS(cache.check(""), std::invalid_argument);
    ASSERT_THROWS(cache.check(".."), std::invalid_argument);
    ASSERT_THROWS(cache.set("../escape"), std::invalid_argument);
    ASSERT_THROWS(cache.set("nested/key"), std::invalid_argument);
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== ResultCache Test Suite ===\n\n";

    fixture = std::make_unique<TempDir>("cache");

    std::cout << "Hit / Miss Tests:\n";
    TEST(miss_when_never_set);
    TEST(hit_after_set);
    TEST(keys_are_independent);
    TEST(stale_marker_is_miss);
    TEST(marker_just_inside_ttl_is_hit);
    TEST(set_refreshes_stale_marker);
    TEST(persists_across_instances);

    std::cout << "\nInvalidation Tests:\n";
    TEST(invalidate_all);
    TEST(invalidate_skips_unremovable_entries);
    TEST(invalidate_missing_directory);

    std::cout << "\nKey Validation Tests:\n";
    TEST(invalid_keys_rejected);

    fixture.reset();

    TEST_SUMMARY();
    return (tests_passed == tests_run) ? 0 : 1;
}
