// health_scorer.cpp - Project health score (0-100)
// Part of ignite_build - Ignite Build Orchestrator

#include "health/health_scorer.hpp"

#include <algorithm>

namespace ignite::build {

HealthReport HealthScorer::compute(uint64_t session_error_count,
                                   uint64_t historical_error_total,
                                   bool required_marker_present) {
    HealthReport report;
    int score = BASE_SCORE;

    if (session_error_count > 0) {
        score -= SESSION_ERROR_PENALTY;
        report.issues.emplace_back(SESSION_ERRORS_LABEL);
    }

    if (historical_error_total > HISTORICAL_ERROR_THRESHOLD) {
        score -= HISTORICAL_ERROR_PENALTY;
        report.issues.emplace_back(HISTORICAL_ERRORS_LABEL);
    }

    if (!required_marker_present) {
        score -= MISSING_DESCRIPTOR_PENALTY;
        report.issues.emplace_back(MISSING_DESCRIPTOR_LABEL);
    }

    report.score = std::clamp(score, 0, BASE_SCORE);
    return report;
}

HealthTier HealthScorer::tier(int score) {
    if (score >= 80) return HealthTier::EXCELLENT;
    if (score >= 60) return HealthTier::GOOD;
    return HealthTier::ATTENTION;
}

} // namespace ignite::build
