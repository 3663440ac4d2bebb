#ifndef IGNITE_BUILD_HEALTH_SCORER_HPP
#define IGNITE_BUILD_HEALTH_SCORER_HPP

// health_scorer.hpp - Project health score (0-100)
// Part of ignite_build - Ignite Build Orchestrator

#include <cstdint>
#include <string>
#include <vector>

namespace ignite::build {

struct HealthReport {
    int score = 100;                  // Clamped to [0, 100]
    std::vector<std::string> issues;  // Contributing labels, deduction order
};

enum class HealthTier {
    EXCELLENT,   // >= 80
    GOOD,        // >= 60
    ATTENTION
};

inline const char* health_tier_to_string(HealthTier tier) {
    switch (tier) {
        case HealthTier::EXCELLENT: return "excellent";
        case HealthTier::GOOD:      return "good";
        case HealthTier::ATTENTION: return "attention";
        default:                    return "unknown";
    }
}

class HealthScorer {
public:
    static constexpr int BASE_SCORE = 100;
    static constexpr int SESSION_ERROR_PENALTY = 20;
    static constexpr int HISTORICAL_ERROR_PENALTY = 10;
    static constexpr int MISSING_DESCRIPTOR_PENALTY = 30;
    static constexpr uint64_t HISTORICAL_ERROR_THRESHOLD = 10;

    static constexpr const char* SESSION_ERRORS_LABEL = "session errors";
    static constexpr const char* HISTORICAL_ERRORS_LABEL = "elevated historical error count";
    static constexpr const char* MISSING_DESCRIPTOR_LABEL = "missing project descriptor";

    static HealthReport compute(uint64_t session_error_count,
                                uint64_t historical_error_total,
                                bool required_marker_present);

    static HealthTier tier(int score);
};

} // namespace ignite::build

#endif // IGNITE_BUILD_HEALTH_SCORER_HPP
