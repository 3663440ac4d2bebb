/**
 * build_orchestrator.hpp
 * Central Build Orchestrator for ignite_build
 *
 * Integrates:
 * - CommandRunner for streaming, classified tool execution
 * - ResultCache for the toolchain-target prerequisite check
 * - MetricsStore for cross-session build/test history
 * - HealthScorer for the diagnose report
 *
 * Action Flow:
 * 1. Count the action in SessionStats
 * 2. Consult ResultCache for cacheable prerequisites
 * 3. Run each external step through CommandRunner
 * 4. Feed step results into SessionStats and MetricsStore
 * 5. Flush MetricsStore (also when the action is interrupted)
 * 6. Return a structured outcome
 *
 * All state is injected (OrchestratorContext); nothing is global.
 *
 * Copyright (c) 2025 Redstone OS Project
 */

#ifndef IGNITE_BUILD_BUILD_ORCHESTRATOR_HPP
#define IGNITE_BUILD_BUILD_ORCHESTRATOR_HPP

#include "core/command_runner.hpp"
#include "core/errors.hpp"
#include "core/event_log.hpp"
#include "core/project_config.hpp"
#include "health/health_scorer.hpp"
#include "state/metrics_record.hpp"
#include "state/metrics_store.hpp"
#include "state/result_cache.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ignite::build {

namespace fs = std::filesystem;

// =============================================================================
// Action Parameters
// =============================================================================

enum class BuildProfile {
    DEBUG,
    RELEASE,
    VERBOSE     // Debug output location, tool run with --verbose
};

enum class TestKind {
    ALL,
    UNIT,
    INTEGRATION
};

enum class CheckKind {
    STATIC,     // cargo check
    FORMAT,     // rustfmt --check
    LINT,       // clippy
    ALL         // all of the above + optional audit/freshness
};

enum class CleanScope {
    STANDARD,   // transient build output only
    FULL        // + result cache + distribution tree
};

enum class StepStatus {
    PASSED,
    FAILED,
    NOT_APPLICABLE   // Tool not installed; never counted as failure
};

const char* build_profile_to_string(BuildProfile profile);
const char* test_kind_to_string(TestKind kind);
const char* check_kind_to_string(CheckKind kind);
const char* clean_scope_to_string(CleanScope scope);
const char* step_status_to_string(StepStatus status);

std::optional<BuildProfile> parse_build_profile(const std::string& text);
std::optional<TestKind> parse_test_kind(const std::string& text);
std::optional<CheckKind> parse_check_kind(const std::string& text);

// =============================================================================
// Outcomes
// =============================================================================

// Common part of every action result
struct ActionOutcome {
    bool success = false;
    std::string summary;                    // Human-readable one-liner
    std::chrono::milliseconds duration{0};

    // Failure context (enough to diagnose without re-running)
    std::string failed_step;
    ErrorKind error = ErrorKind::NONE;
    int exit_code = 0;

    // Classified output lines over all steps of the action
    size_t error_count = 0;
    size_t warning_count = 0;
};

struct ArtifactInfo {
    fs::path path;
    uintmax_t size_bytes = 0;
    std::string sha256;                       // 64 lowercase hex chars
    std::chrono::milliseconds build_duration{0};
};

struct BuildOutcome : ActionOutcome {
    BuildProfile profile = BuildProfile::DEBUG;
    bool prerequisite_cached = false;
    std::optional<ArtifactInfo> artifact;     // Only on success
};

struct TestOutcome : ActionOutcome {
    TestKind kind = TestKind::ALL;
    std::optional<uint64_t> passed_count;     // Best-effort from tool output
    std::string result_line;                  // First "test result:" line
};

struct CheckItemOutcome {
    std::string name;
    StepStatus status = StepStatus::NOT_APPLICABLE;
    int exit_code = 0;
    std::chrono::milliseconds duration{0};
    std::string detail;
};

struct CheckOutcome : ActionOutcome {
    CheckKind kind = CheckKind::ALL;
    std::vector<CheckItemOutcome> items;      // Submission order
    size_t passed = 0;
    size_t applicable = 0;
};

struct DistributionManifest {
    std::string name;
    std::string version;
    std::string profile;
    std::string build_date;                   // ISO-8601 UTC
    std::string binary_hash;                  // SHA-256, lowercase hex
    uintmax_t binary_size = 0;

    std::string to_json() const;
};

struct DistributionOutcome : ActionOutcome {
    BuildProfile profile = BuildProfile::RELEASE;
    fs::path dist_dir;
    fs::path manifest_path;
    bool config_staged = false;
    std::optional<DistributionManifest> manifest;   // Only on success
};

struct CleanOutcome : ActionOutcome {
    CleanScope scope = CleanScope::STANDARD;
    size_t cache_entries_removed = 0;
    bool dist_removed = false;
};

struct ToolStatus {
    std::string name;
    bool available = false;
    std::string detail;      // Version string or reason
};

struct DiagnosticReport : ActionOutcome {
    std::vector<ToolStatus> tools;
    fs::path project_root;
    bool descriptor_present = false;
    size_t test_file_count = 0;
    size_t log_file_count = 0;

    SessionStats session;
    HistoricalMetrics history;
    LoadStatus metrics_status = LoadStatus::MISSING;
    std::optional<double> average_build_seconds;   // Last 5 samples
    std::optional<double> average_test_seconds;    // Last 5 samples

    HealthReport health;
    HealthTier tier = HealthTier::ATTENTION;
};

// =============================================================================
// Progress Callback
// =============================================================================

struct ActionProgress {
    std::string action;      // "build", "test", ...
    std::string step;        // "prerequisite", "compile", "static-check", ...
    std::string message;
};

using ProgressCallback = std::function<void(const ActionProgress&)>;

// =============================================================================
// Injected State
// =============================================================================

struct OrchestratorContext {
    CommandRunner& runner;
    ResultCache& cache;
    MetricsStore& metrics;
    SessionStats& session;
    EventSink& events;
};

// =============================================================================
// Build Orchestrator
// =============================================================================

class BuildOrchestrator {
public:
    static constexpr size_t ROLLING_WINDOW = 5;

    BuildOrchestrator(ProjectConfig config, OrchestratorContext context);

    // No copying
    BuildOrchestrator(const BuildOrchestrator&) = delete;
    BuildOrchestrator& operator=(const BuildOrchestrator&) = delete;

    // =========================================================================
    // Actions
    // =========================================================================
    //
    // Every action flushes MetricsStore before returning. InterruptedError
    // propagates to the caller after the flush.

    /**
     * Ensure the target triple is installed (cached for an hour), then build.
     * On success the artifact's size and SHA-256 are reported and the
     * duration is recorded.
     */
    BuildOutcome build(BuildProfile profile, const std::vector<std::string>& features = {});

    /**
     * Run the test suite. `parallel == false` pins the test harness to one
     * thread; the orchestrator itself never runs tools concurrently.
     */
    TestOutcome test(TestKind kind, bool parallel = true);

    /**
     * Run verification tools in order. Missing tools are NOT_APPLICABLE.
     */
    CheckOutcome check(CheckKind kind);

    /**
     * Build, stage the artifact (and config file) into the distribution tree,
     * and write the manifest. No manifest is left behind if staging fails.
     */
    DistributionOutcome distribute(BuildProfile profile);

    CleanOutcome clean(CleanScope scope);

    /**
     * Read-only environment and health report. Only diagnostics_run changes.
     */
    DiagnosticReport diagnose();

    std::vector<LogFileInfo> recent_logs(size_t limit = 10) const;

    // =========================================================================
    // Command Construction (public for tests and dry listings)
    // =========================================================================

    std::vector<std::string> build_arguments(BuildProfile profile,
                                             const std::vector<std::string>& features) const;

    std::vector<std::string> test_arguments(TestKind kind, bool parallel) const;

    // <target_dir>/<triple>/<debug|release>/<artifact>
    fs::path artifact_path(BuildProfile profile) const;

    // =========================================================================
    // Configuration
    // =========================================================================

    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    const ProjectConfig& config() const { return config_; }

private:
    // Verification item for check()
    struct PlannedCheck {
        std::string name;
        std::vector<std::string> args;
        std::optional<std::string> version_check;   // Subcommand asked for --version
    };

    // =========================================================================
    // Action Bodies (no flushing)
    // =========================================================================

    BuildOutcome run_build(BuildProfile profile, const std::vector<std::string>& features);
    TestOutcome run_test(TestKind kind, bool parallel);
    CheckOutcome run_check(CheckKind kind);
    DistributionOutcome run_distribute(BuildProfile profile);
    CleanOutcome run_clean(CleanScope scope);

    // =========================================================================
    // Helper Functions
    // =========================================================================

    // Prerequisite: toolchain target installed (ResultCache-backed)
    bool ensure_target(BuildOutcome& outcome);

    /**
     * Run one external step and fold its result into the outcome.
     *
     * Spawn failures and non-zero exits mark the outcome failed and count as
     * session and historical errors. Returns nullopt on spawn failure.
     */
    std::optional<CommandResult> run_step(const std::string& action,
                                          const std::string& step,
                                          const std::string& program,
                                          const std::vector<std::string>& args,
                                          ActionOutcome& outcome);

    CheckItemOutcome run_check_item(const PlannedCheck& planned, CheckOutcome& outcome);

    std::vector<PlannedCheck> check_plan(CheckKind kind) const;

    // Copy the artifact and config file, then write the manifest
    void stage_distribution(const ArtifactInfo& artifact, DistributionOutcome& outcome);

    void record_failure(ActionOutcome& outcome, const std::string& step,
                        ErrorKind kind, int exit_code, const std::string& summary);

    void flush_metrics();

    void report_progress(const std::string& action, const std::string& step,
                         const std::string& message);

    // =========================================================================
    // Member Data
    // =========================================================================

    ProjectConfig config_;
    OrchestratorContext ctx_;
    ProgressCallback progress_cb_;
};

// Sum of "N passed" over all "test result:" lines, nullopt if none
std::optional<uint64_t> extract_passed_count(const std::string& output, std::string* first_line = nullptr);

} // namespace ignite::build

#endif // IGNITE_BUILD_BUILD_ORCHESTRATOR_HPP
