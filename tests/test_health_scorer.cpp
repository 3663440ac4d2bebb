// test_health_scorer.cpp - Tests for HealthScorer
// Part of ignite_build - Ignite Build Orchestrator

#include "test_harness.hpp"

#include "health/health_scorer.hpp"

using namespace ignite::build;

// =============================================================================
// Score Tests
// =============================================================================

void test_perfect_health() {
    HealthReport report = HealthScorer::compute(0, 0, true);
    ASSERT_EQ(report.score, 100);
    ASSERT(report.issues.empty());
}

void test_session_error_costs_twenty() {
    HealthReport clean = HealthScorer::compute(0, 3, true);
    HealthReport failing = HealthScorer::compute(1, 3, true);
    ASSERT_EQ(clean.score - failing.score, 20);

    // Any number of session errors is one deduction
    ASSERT_EQ(HealthScorer::compute(50, 3, true).score, failing.score);
}

void test_historical_threshold() {
    ASSERT_EQ(HealthScorer::compute(0, 10, true).score, 100);
    ASSERT_EQ(HealthScorer::compute(0, 11, true).score, 90);
}

void test_missing_descriptor() {
    HealthReport report = HealthScorer::compute(0, 0, false);
    ASSERT_EQ(report.score, 70);
    ASSERT_EQ(report.issues.size(), size_t(1));
    ASSERT_EQ(report.issues[0], std::string(HealthScorer::MISSING_DESCRIPTOR_LABEL));
}

void test_all_deductions_in_order() {
    HealthReport report = HealthScorer::compute(2, 25, false);
    ASSERT_EQ(report.score, 40);
    ASSERT_EQ(report.issues.size(), size_t(3));
    ASSERT_EQ(report.issues[0], std::string(HealthScorer::SESSION_ERRORS_LABEL));
    ASSERT_EQ(report.issues[1], std::string(HealthScorer::HISTORICAL_ERRORS_LABEL));
    ASSERT_EQ(report.issues[2], std::string(HealthScorer::MISSING_DESCRIPTOR_LABEL));
}

void test_score_in_range() {
    for (uint64_t session : {0ULL, 1ULL, 1000ULL}) {
        for (uint64_t history : {0ULL, 10ULL, 11ULL, 1000000ULL}) {
            for (bool marker : {true, false}) {
                int score = HealthScorer::compute(session, history, marker).score;
                ASSERT(score >= 0 && score <= 100);
            }
        }
    }
}

// =============================================================================
// Tier Tests
// =============================================================================

void test_tiers() {
    ASSERT(HealthScorer::tier(100) == HealthTier::EXCELLENT);
    ASSERT(HealthScorer::tier(80) == HealthTier::EXCELLENT);
    ASSERT(HealthScorer::tier(79) == HealthTier::GOOD);
    ASSERT(HealthScorer::tier(60) == HealthTier::GOOD);
    ASSERT(HealthScorer::tier(59) == HealthTier::ATTENTION);
    ASSERT(HealthScorer::tier(0) == HealthTier::ATTENTION);
    ASSERT_EQ(std::string(health_tier_to_string(HealthTier::GOOD)), std::string("good"));
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== HealthScorer Test Suite ===\n\n";

    std::cout << "Score Tests:\n";
    TEST(perfect_health);
    TEST(session_error_costs_twenty);
    TEST(historical_threshold);
    TEST(missing_descriptor);
    TEST(all_deductions_in_order);
    TEST(score_in_range);

    std::cout << "\nTier Tests:\n";
    TEST(tiers);

    TEST_SUMMARY();
    return (tests_passed == tests_run) ? 0 : 1;
}
