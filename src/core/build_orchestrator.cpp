/**
 * build_orchestrator.cpp
 * Implementation of the Central Build Orchestrator
 *
 * Copyright (c) 2025 Redstone OS Project
 */

#include "core/build_orchestrator.hpp"
#include "core/content_hash.hpp"
#include "core/json_text.hpp"
#include "core/timestamp.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace ignite::build {

// =============================================================================
// Enum Names
// =============================================================================

const char* build_profile_to_string(BuildProfile profile) {
    switch (profile) {
        case BuildProfile::DEBUG:   return "debug";
        case BuildProfile::RELEASE: return "release";
        case BuildProfile::VERBOSE: return "verbose";
        default:                    return "unknown";
    }
}

const char* test_kind_to_string(TestKind kind) {
    switch (kind) {
        case TestKind::ALL:         return "all";
        case TestKind::UNIT:        return "unit";
        case TestKind::INTEGRATION: return "integration";
        default:                    return "unknown";
    }
}

const char* check_kind_to_string(CheckKind kind) {
    switch (kind) {
        case CheckKind::STATIC: return "static";
        case CheckKind::FORMAT: return "format";
        case CheckKind::LINT:   return "lint";
        case CheckKind::ALL:    return "all";
        default:                return "unknown";
    }
}

const char* clean_scope_to_string(CleanScope scope) {
    switch (scope) {
        case CleanScope::STANDARD: return "standard";
        case CleanScope::FULL:     return "full";
        default:                   return "unknown";
    }
}

const char* step_status_to_string(StepStatus status) {
    switch (status) {
        case StepStatus::PASSED:         return "passed";
        case StepStatus::FAILED:         return "failed";
        case StepStatus::NOT_APPLICABLE: return "not_applicable";
        default:                         return "unknown";
    }
}

std::optional<BuildProfile> parse_build_profile(const std::string& text) {
    if (text == "debug") return BuildProfile::DEBUG;
    if (text == "release") return BuildProfile::RELEASE;
    if (text == "verbose") return BuildProfile::VERBOSE;
    return std::nullopt;
}

std::optional<TestKind> parse_test_kind(const std::string& text) {
    if (text == "all") return TestKind::ALL;
    if (text == "unit") return TestKind::UNIT;
    if (text == "integration") return TestKind::INTEGRATION;
    return std::nullopt;
}

std::optional<CheckKind> parse_check_kind(const std::string& text) {
    if (text == "static" || text == "check") return CheckKind::STATIC;
    if (text == "format" || text == "fmt") return CheckKind::FORMAT;
    if (text == "lint" || text == "clippy") return CheckKind::LINT;
    if (text == "all") return CheckKind::ALL;
    return std::nullopt;
}

namespace {

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

bool output_lists_line(const std::string& output, const std::string& wanted) {
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        line.erase(0, line.find_first_not_of(" \t\r"));
        line.erase(line.find_last_not_of(" \t\r") + 1);
        if (line == wanted) {
            return true;
        }
    }
    return false;
}

void copy_or_throw(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw FilesystemError("Cannot copy " + from.string() + " to " + to.string()
                              + ": " + ec.message());
    }
}

void create_dirs_or_throw(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw FilesystemError("Cannot create " + dir.string() + ": " + ec.message());
    }
}

// Temp file + rename so a reader never sees a half-written manifest
void write_file_atomically(const fs::path& path, const std::string& content) {
    fs::path temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw FilesystemError("Cannot write " + temp_path.string());
        }
        file << content;
        file.flush();
        if (!file.good()) {
            throw FilesystemError("Write error on " + temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        throw FilesystemError("Cannot replace " + path.string() + ": " + ec.message());
    }
}

} // namespace

std::optional<uint64_t> extract_passed_count(const std::string& output, std::string* first_line) {
    static const std::regex passed_regex(R"((\d+)\s+passed)");

    std::optional<uint64_t> total;
    std::istringstream lines(output);
    std::string line;

    while (std::getline(lines, line)) {
        if (line.find("test result:") == std::string::npos) {
            continue;
        }
        if (first_line && first_line->empty()) {
            *first_line = line;
        }

        std::smatch match;
        if (std::regex_search(line, match, passed_regex)) {
            try {
                total = total.value_or(0) + std::stoull(match[1].str());
            } catch (const std::out_of_range&) {
                // Count does not fit in 64 bits: skip the line
                continue;
            }
        }
    }
    return total;
}

std::string DistributionManifest::to_json() const {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"name\": \"" << escape_json(name) << "\",\n";
    oss << "  \"version\": \"" << escape_json(version) << "\",\n";
    oss << "  \"profile\": \"" << escape_json(profile) << "\",\n";
    oss << "  \"build_date\": \"" << escape_json(build_date) << "\",\n";
    oss << "  \"binary_hash\": \"" << binary_hash << "\",\n";
    oss << "  \"binary_size\": " << binary_size << "\n";
    oss << "}\n";
    return oss.str();
}

// =============================================================================
// Build Orchestrator Implementation
// =============================================================================

BuildOrchestrator::BuildOrchestrator(ProjectConfig config, OrchestratorContext context)
    : config_(std::move(config))
    , ctx_(context) {
    if (config_.project_root.empty()) {
        config_.project_root = fs::current_path();
    }
}

BuildOutcome BuildOrchestrator::build(BuildProfile profile,
                                      const std::vector<std::string>& features) {
    try {
        BuildOutcome outcome = run_build(profile, features);
        flush_metrics();
        return outcome;
    } catch (const InterruptedError&) {
        flush_metrics();
        throw;
    }
}

TestOutcome BuildOrchestrator::test(TestKind kind, bool parallel) {
    try {
        TestOutcome outcome = run_test(kind, parallel);
        flush_metrics();
        return outcome;
    } catch (const InterruptedError&) {
        flush_metrics();
        throw;
    }
}

CheckOutcome BuildOrchestrator::check(CheckKind kind) {
    try {
        CheckOutcome outcome = run_check(kind);
        flush_metrics();
        return outcome;
    } catch (const InterruptedError&) {
        flush_metrics();
        throw;
    }
}

DistributionOutcome BuildOrchestrator::distribute(BuildProfile profile) {
    try {
        DistributionOutcome outcome = run_distribute(profile);
        flush_metrics();
        return outcome;
    } catch (const InterruptedError&) {
        flush_metrics();
        throw;
    }
}

CleanOutcome BuildOrchestrator::clean(CleanScope scope) {
    try {
        CleanOutcome outcome = run_clean(scope);
        flush_metrics();
        return outcome;
    } catch (const InterruptedError&) {
        flush_metrics();
        throw;
    }
}

// =============================================================================
// Build
// =============================================================================

std::vector<std::string> BuildOrchestrator::build_arguments(
    BuildProfile profile, const std::vector<std::string>& features) const {
    std::vector<std::string> args = {
        "build", "--package", config_.package, "--target", config_.target
    };

    if (profile == BuildProfile::RELEASE) {
        args.push_back("--release");
    } else if (profile == BuildProfile::VERBOSE) {
        args.push_back("--verbose");
    }

    if (!features.empty()) {
        args.push_back("--features");
        args.push_back(join(features, ","));
    }

    return args;
}

fs::path BuildOrchestrator::artifact_path(BuildProfile profile) const {
    const char* subdir = profile == BuildProfile::RELEASE ? "release" : "debug";
    return config_.resolve(config_.target_dir) / config_.target / subdir / config_.artifact;
}

BuildOutcome BuildOrchestrator::run_build(BuildProfile profile,
                                          const std::vector<std::string>& features) {
    auto start_time = std::chrono::steady_clock::now();
    std::string profile_name = build_profile_to_string(profile);

    BuildOutcome outcome;
    outcome.profile = profile;

    ctx_.session.builds++;
    ctx_.events.record(Severity::INFO, "=== BUILD " + upper(profile_name) + " STARTED ===");

    // Stage 1: prerequisite (toolchain target installed)
    if (!ensure_target(outcome)) {
        outcome.duration = elapsed_since(start_time);
        outcome.summary = "Prerequisite failed: target " + config_.target + " unavailable";
        ctx_.events.record(Severity::ERROR, "=== BUILD " + upper(profile_name) + " FINISHED - FAILURE ===");
        return outcome;
    }

    // Stage 2: compile
    report_progress("build", "compile", "Compiling in " + profile_name + " mode");
    auto result = run_step("build", "compile", config_.build_tool,
                           build_arguments(profile, features), outcome);

    if (!result || !result->success) {
        outcome.duration = elapsed_since(start_time);
        if (result) {
            outcome.summary = "Build " + profile_name + " failed (exit code "
                + std::to_string(result->exit_code) + ", "
                + std::to_string(result->error_count) + " errors)";
        }
        ctx_.events.record(Severity::ERROR, "=== BUILD " + upper(profile_name) + " FINISHED - FAILURE ===");
        return outcome;
    }

    // Stage 3: describe the artifact
    fs::path binary = artifact_path(profile);
    ArtifactInfo artifact;
    artifact.path = binary;
    artifact.build_duration = result->duration;

    try {
        std::error_code ec;
        if (!fs::is_regular_file(binary, ec)) {
            throw FilesystemError("Artifact not found: " + binary.string());
        }
        artifact.size_bytes = fs::file_size(binary, ec);
        if (ec) {
            throw FilesystemError("Cannot stat " + binary.string() + ": " + ec.message());
        }
        artifact.sha256 = sha256_file(binary);
    } catch (const FilesystemError& e) {
        record_failure(outcome, "artifact", ErrorKind::FILESYSTEM, 0, e.what());
        outcome.duration = elapsed_since(start_time);
        ctx_.events.record(Severity::ERROR, "=== BUILD " + upper(profile_name) + " FINISHED - FAILURE ===");
        return outcome;
    }

    ctx_.metrics.record_build(result->duration_seconds());

    ctx_.events.record(Severity::INFO, "Binary produced: " + binary.string() + " ("
                       + std::to_string(artifact.size_bytes) + " bytes, sha256 "
                       + artifact.sha256 + ")");

    outcome.artifact = artifact;
    outcome.success = true;
    outcome.duration = elapsed_since(start_time);
    outcome.summary = "Build " + profile_name + " succeeded: " + binary.filename().string()
        + " (" + std::to_string(artifact.size_bytes) + " bytes)";

    ctx_.events.record(Severity::INFO, "=== BUILD " + upper(profile_name) + " FINISHED - SUCCESS ===");
    return outcome;
}

bool BuildOrchestrator::ensure_target(BuildOutcome& outcome) {
    std::string key = "target-" + config_.target;

    if (ctx_.cache.check(key)) {
        outcome.prerequisite_cached = true;
        ctx_.events.record(Severity::INFO, "Target " + config_.target + " verified (cached)");
        return true;
    }

    report_progress("build", "prerequisite", "Verifying target " + config_.target);
    auto listed = run_step("build", "prerequisite", config_.toolchain_manager,
                           {"target", "list", "--installed"}, outcome);
    if (!listed || !listed->success) {
        return false;
    }

    if (!output_lists_line(listed->output, config_.target)) {
        report_progress("build", "prerequisite", "Installing target " + config_.target);
        auto added = run_step("build", "prerequisite", config_.toolchain_manager,
                              {"target", "add", config_.target}, outcome);
        if (!added || !added->success) {
            return false;
        }
    }

    try {
        ctx_.cache.set(key);
    } catch (const StateAccessError& e) {
        // Not fatal: the check simply reruns next time
        spdlog::warn("Cannot cache prerequisite result: {}", e.what());
        ctx_.events.record(Severity::WARNING, std::string("Cache write failed: ") + e.what());
    }
    return true;
}

// =============================================================================
// Test
// =============================================================================

std::vector<std::string> BuildOrchestrator::test_arguments(TestKind kind, bool parallel) const {
    std::vector<std::string> args = {"test", "--package", config_.package};

    if (kind == TestKind::UNIT) {
        args.push_back("--lib");
    } else if (kind == TestKind::INTEGRATION) {
        args.push_back("--test");
        args.push_back("*");
    }

    if (!parallel) {
        args.push_back("--");
        args.push_back("--test-threads=1");
    }

    return args;
}

TestOutcome BuildOrchestrator::run_test(TestKind kind, bool parallel) {
    auto start_time = std::chrono::steady_clock::now();
    std::string kind_name = test_kind_to_string(kind);

    TestOutcome outcome;
    outcome.kind = kind;

    ctx_.session.tests++;
    ctx_.events.record(Severity::INFO, "=== TESTS " + upper(kind_name) + " STARTED ===");

    report_progress("test", "run", "Running " + kind_name + " tests");
    auto result = run_step("test", "run", config_.build_tool,
                           test_arguments(kind, parallel), outcome);

    outcome.duration = elapsed_since(start_time);

    if (!result || !result->success) {
        if (result) {
            extract_passed_count(result->output, &outcome.result_line);
            outcome.summary = "Tests " + kind_name + " failed (exit code "
                + std::to_string(result->exit_code) + ")";
        }
        ctx_.events.record(Severity::ERROR, "=== TESTS " + upper(kind_name) + " FINISHED - FAILURE ===");
        return outcome;
    }

    ctx_.metrics.record_test(result->duration_seconds());

    outcome.passed_count = extract_passed_count(result->output, &outcome.result_line);
    outcome.success = true;
    outcome.summary = "Tests " + kind_name + " succeeded";
    if (outcome.passed_count) {
        outcome.summary += " (" + std::to_string(*outcome.passed_count) + " passed)";
    }

    ctx_.events.record(Severity::INFO, "=== TESTS " + upper(kind_name) + " FINISHED - SUCCESS ===");
    return outcome;
}

// =============================================================================
// Check
// =============================================================================

std::vector<BuildOrchestrator::PlannedCheck> BuildOrchestrator::check_plan(CheckKind kind) const {
    const std::string& pkg = config_.package;
    std::vector<PlannedCheck> plan;

    if (kind == CheckKind::STATIC || kind == CheckKind::ALL) {
        plan.push_back({"static-check", {"check", "--package", pkg}, std::nullopt});
    }
    if (kind == CheckKind::FORMAT || kind == CheckKind::ALL) {
        plan.push_back({"format-check", {"fmt", "--package", pkg, "--", "--check"}, std::string("fmt")});
    }
    if (kind == CheckKind::LINT || kind == CheckKind::ALL) {
        plan.push_back({"lint", {"clippy", "--package", pkg}, std::string("clippy")});
    }
    if (kind == CheckKind::ALL) {
        plan.push_back({"audit", {"audit"}, std::string("audit")});
        plan.push_back({"dependency-freshness", {"outdated", "--exit-code", "1"}, std::string("outdated")});
    }

    return plan;
}

CheckOutcome BuildOrchestrator::run_check(CheckKind kind) {
    auto start_time = std::chrono::steady_clock::now();
    std::string kind_name = check_kind_to_string(kind);

    CheckOutcome outcome;
    outcome.kind = kind;

    ctx_.session.checks++;
    ctx_.events.record(Severity::INFO, "=== CHECK " + upper(kind_name) + " STARTED ===");

    // Sequential, submission order
    for (const auto& planned : check_plan(kind)) {
        CheckItemOutcome item = run_check_item(planned, outcome);

        if (item.status != StepStatus::NOT_APPLICABLE) {
            outcome.applicable++;
            if (item.status == StepStatus::PASSED) {
                outcome.passed++;
            }
        }
        outcome.items.push_back(std::move(item));
    }

    size_t not_applicable = outcome.items.size() - outcome.applicable;

    outcome.success = (outcome.passed == outcome.applicable);
    outcome.duration = elapsed_since(start_time);
    outcome.summary = std::to_string(outcome.passed) + "/" + std::to_string(outcome.applicable)
        + " checks passed";
    if (not_applicable > 0) {
        outcome.summary += " (" + std::to_string(not_applicable) + " not applicable)";
    }

    if (outcome.success) {
        outcome.failed_step.clear();
        outcome.error = ErrorKind::NONE;
    }

    ctx_.events.record(outcome.success ? Severity::INFO : Severity::ERROR,
                       "=== CHECK FINISHED - " + std::to_string(outcome.passed) + "/"
                       + std::to_string(outcome.applicable) + " PASSED ===");
    return outcome;
}

CheckItemOutcome BuildOrchestrator::run_check_item(const PlannedCheck& planned, CheckOutcome& outcome) {
    CheckItemOutcome item;
    item.name = planned.name;

    report_progress("check", planned.name, "Running " + planned.name);

    // Optional tools: confirm the subcommand exists first
    if (planned.version_check) {
        try {
            CommandResult installed = ctx_.runner.execute(config_.build_tool,
                                                          {*planned.version_check, "--version"},
                                                          config_.project_root);
            ctx_.session.commands_run++;
            if (!installed.success) {
                item.status = StepStatus::NOT_APPLICABLE;
                item.detail = config_.build_tool + " " + *planned.version_check + " is not installed";
                ctx_.events.record(Severity::INFO, planned.name + ": not applicable (" + item.detail + ")");
                return item;
            }
        } catch (const ExecutionError& e) {
            item.status = StepStatus::NOT_APPLICABLE;
            item.detail = e.what();
            ctx_.events.record(Severity::INFO, planned.name + ": not applicable (" + item.detail + ")");
            return item;
        }
    }

    CommandResult result;
    try {
        result = ctx_.runner.execute(config_.build_tool, planned.args, config_.project_root);
    } catch (const ExecutionError& e) {
        item.duration = e.elapsed();
        item.detail = e.what();

        // An optional tool that answered --version may still vanish
        if (planned.version_check) {
            item.status = StepStatus::NOT_APPLICABLE;
            ctx_.events.record(Severity::INFO, planned.name + ": not applicable (" + item.detail + ")");
            return item;
        }

        // Required items cannot be skipped
        item.status = StepStatus::FAILED;
        item.exit_code = -1;
        ctx_.session.errors++;
        ctx_.metrics.record_error();
        ctx_.events.record(Severity::ERROR, "check " + planned.name + ": " + item.detail);

        if (outcome.failed_step.empty()) {
            outcome.failed_step = planned.name;
            outcome.error = ErrorKind::EXECUTION;
            outcome.exit_code = -1;
        }
        return item;
    }

    ctx_.session.commands_run++;
    ctx_.session.warnings += result.warning_count;
    outcome.error_count += result.error_count;
    outcome.warning_count += result.warning_count;

    item.exit_code = result.exit_code;
    item.duration = result.duration;

    if (result.success) {
        item.status = StepStatus::PASSED;
    } else {
        item.status = StepStatus::FAILED;
        item.detail = "exit code " + std::to_string(result.exit_code);
        ctx_.session.errors++;
        ctx_.metrics.record_error();

        // First failing item is the failure context of the action
        if (outcome.failed_step.empty()) {
            outcome.failed_step = planned.name;
            outcome.error = ErrorKind::NON_ZERO_EXIT;
            outcome.exit_code = result.exit_code;
        }
    }

    return item;
}

// =============================================================================
// Distribute
// =============================================================================

DistributionOutcome BuildOrchestrator::run_distribute(BuildProfile profile) {
    auto start_time = std::chrono::steady_clock::now();
    std::string profile_name = build_profile_to_string(profile);

    DistributionOutcome outcome;
    outcome.profile = profile;
    outcome.dist_dir = config_.resolve(config_.dist_dir);
    outcome.manifest_path = outcome.dist_dir / config_.manifest;

    ctx_.events.record(Severity::INFO, "=== DISTRIBUTION " + upper(profile_name) + " STARTED ===");

    // Build first
    BuildOutcome built = run_build(profile, {});
    outcome.error_count = built.error_count;
    outcome.warning_count = built.warning_count;

    if (!built.success || !built.artifact) {
        outcome.failed_step = built.failed_step;
        outcome.error = built.error;
        outcome.exit_code = built.exit_code;
        outcome.duration = elapsed_since(start_time);
        outcome.summary = "Build failed - distribution aborted";
        ctx_.events.record(Severity::ERROR, "Build failed - distribution aborted");
        return outcome;
    }

    report_progress("distribute", "staging", "Staging " + outcome.dist_dir.string());

    try {
        stage_distribution(*built.artifact, outcome);
    } catch (const FilesystemError& e) {
        outcome.manifest.reset();
        record_failure(outcome, "staging", ErrorKind::FILESYSTEM, 0, e.what());
        outcome.duration = elapsed_since(start_time);
        ctx_.events.record(Severity::ERROR, "=== DISTRIBUTION FINISHED - FAILURE ===");
        return outcome;
    }

    outcome.success = true;
    outcome.duration = elapsed_since(start_time);
    outcome.summary = "Distribution " + profile_name + " created in " + outcome.dist_dir.string()
        + " (" + std::to_string(outcome.manifest->binary_size) + " bytes)";

    ctx_.events.record(Severity::INFO, "=== DISTRIBUTION FINISHED - "
                       + std::to_string(outcome.manifest->binary_size) + " bytes ===");
    return outcome;
}

void BuildOrchestrator::stage_distribution(const ArtifactInfo& artifact,
                                           DistributionOutcome& outcome) {
    // A manifest must never describe a partially staged tree
    std::error_code ec;
    fs::remove(outcome.manifest_path, ec);
    if (ec) {
        throw FilesystemError("Cannot remove stale manifest " + outcome.manifest_path.string()
                              + ": " + ec.message());
    }

    fs::path efi_dir = outcome.dist_dir / config_.efi_dir;
    fs::path boot_dir = outcome.dist_dir / config_.boot_dir;

    create_dirs_or_throw(efi_dir);
    create_dirs_or_throw(boot_dir);

    fs::path staged_binary = efi_dir / config_.boot_binary;
    copy_or_throw(artifact.path, staged_binary);
    ctx_.events.record(Severity::INFO, "Bootloader staged: " + staged_binary.string());

    fs::path config_source = config_.project_root / config_.config_file;
    if (fs::is_regular_file(config_source, ec)) {
        copy_or_throw(config_source, boot_dir / config_.config_file);
        outcome.config_staged = true;
        ctx_.events.record(Severity::INFO, "Configuration staged: " + config_.config_file);
    }

    DistributionManifest manifest;
    manifest.name = config_.name;
    manifest.version = config_.version;
    manifest.profile = build_profile_to_string(outcome.profile);
    manifest.build_date = iso8601_utc(std::chrono::system_clock::now());
    manifest.binary_hash = sha256_file(staged_binary);
    manifest.binary_size = fs::file_size(staged_binary, ec);
    if (ec) {
        throw FilesystemError("Cannot stat " + staged_binary.string() + ": " + ec.message());
    }

    write_file_atomically(outcome.manifest_path, manifest.to_json());
    ctx_.events.record(Severity::INFO, "Manifest written: " + outcome.manifest_path.string());

    outcome.manifest = manifest;
}

// =============================================================================
// Clean
// =============================================================================

CleanOutcome BuildOrchestrator::run_clean(CleanScope scope) {
    auto start_time = std::chrono::steady_clock::now();

    CleanOutcome outcome;
    outcome.scope = scope;

    ctx_.events.record(Severity::INFO, "=== CLEAN " + upper(clean_scope_to_string(scope)) + " STARTED ===");

    report_progress("clean", "clean", "Cleaning " + config_.target_dir.string());
    auto result = run_step("clean", "clean", config_.build_tool, {"clean"}, outcome);
    bool cleaned = result && result->success;

    if (scope == CleanScope::FULL) {
        outcome.cache_entries_removed = ctx_.cache.invalidate_all();
        ctx_.events.record(Severity::INFO, "Result cache invalidated ("
                           + std::to_string(outcome.cache_entries_removed) + " entries)");

        fs::path dist = config_.resolve(config_.dist_dir);
        std::error_code ec;
        if (fs::exists(dist, ec)) {
            fs::remove_all(dist, ec);
            if (ec) {
                record_failure(outcome, "remove-dist", ErrorKind::FILESYSTEM, 0,
                               "Cannot remove " + dist.string() + ": " + ec.message());
                cleaned = false;
            } else {
                outcome.dist_removed = true;
                ctx_.events.record(Severity::INFO, dist.string() + " removed");
            }
        }
    }

    outcome.success = cleaned;
    outcome.duration = elapsed_since(start_time);
    if (outcome.success) {
        outcome.summary = std::string("Clean ") + clean_scope_to_string(scope) + " complete";
    } else if (outcome.summary.empty()) {
        outcome.summary = std::string("Clean ") + clean_scope_to_string(scope) + " failed";
    }

    ctx_.events.record(outcome.success ? Severity::INFO : Severity::ERROR, "=== CLEAN FINISHED ===");
    return outcome;
}

// =============================================================================
// Diagnose
// =============================================================================

DiagnosticReport BuildOrchestrator::diagnose() {
    auto start_time = std::chrono::steady_clock::now();

    DiagnosticReport report;
    report.project_root = config_.project_root;

    ctx_.session.diagnostics_run++;
    ctx_.events.record(Severity::INFO, "=== DIAGNOSTICS STARTED ===");

    // Tools
    for (const auto& tool : {config_.build_tool, config_.toolchain_manager}) {
        ToolStatus status;
        status.name = tool;
        auto version = ctx_.runner.capture_version(tool, config_.project_root);
        status.available = version.has_value();
        status.detail = version ? *version : "not installed";
        report.tools.push_back(std::move(status));
    }

    ToolStatus target;
    target.name = "target " + config_.target;
    try {
        CommandResult listed = ctx_.runner.execute(config_.toolchain_manager,
                                                   {"target", "list", "--installed"},
                                                   config_.project_root);
        target.available = listed.success && output_lists_line(listed.output, config_.target);
        target.detail = target.available ? "installed" : "not installed";
    } catch (const ExecutionError&) {
        target.detail = config_.toolchain_manager + " unavailable";
    }
    report.tools.push_back(std::move(target));

    // Project
    std::error_code ec;
    report.descriptor_present = fs::exists(config_.project_root / config_.descriptor, ec);

    fs::path tests_dir = config_.project_root / config_.tests_dir;
    if (fs::is_directory(tests_dir, ec)) {
        for (auto it = fs::recursive_directory_iterator(tests_dir, ec);
             it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;
            if (it->is_regular_file(ec) && it->path().extension() == config_.test_extension) {
                report.test_file_count++;
            }
        }
    }

    report.log_file_count = list_recent_logs(config_.resolve(config_.log_dir),
                                             std::numeric_limits<size_t>::max()).size();

    // Telemetry
    report.session = ctx_.session;
    report.history = ctx_.metrics.snapshot();
    report.metrics_status = ctx_.metrics.last_load_status();
    report.average_build_seconds = ctx_.metrics.rolling_average(DurationKind::BUILD, ROLLING_WINDOW);
    report.average_test_seconds = ctx_.metrics.rolling_average(DurationKind::TEST, ROLLING_WINDOW);

    report.health = HealthScorer::compute(ctx_.session.errors, report.history.total_errors,
                                          report.descriptor_present);
    report.tier = HealthScorer::tier(report.health.score);

    report.success = true;
    report.duration = elapsed_since(start_time);
    report.summary = "Health " + std::to_string(report.health.score) + "/100 ("
        + health_tier_to_string(report.tier) + ")";

    ctx_.events.record(Severity::INFO, "=== DIAGNOSTICS FINISHED - " + report.summary + " ===");
    return report;
}

std::vector<LogFileInfo> BuildOrchestrator::recent_logs(size_t limit) const {
    return list_recent_logs(config_.resolve(config_.log_dir), limit);
}

// =============================================================================
// Helper Functions
// =============================================================================

std::optional<CommandResult> BuildOrchestrator::run_step(const std::string& action,
                                                         const std::string& step,
                                                         const std::string& program,
                                                         const std::vector<std::string>& args,
                                                         ActionOutcome& outcome) {
    CommandResult result;
    try {
        result = ctx_.runner.execute(program, args, config_.project_root);
    } catch (const ExecutionError& e) {
        record_failure(outcome, step, ErrorKind::EXECUTION, -1,
                       action + " " + step + ": " + e.what());
        return std::nullopt;
    }

    ctx_.session.commands_run++;
    ctx_.session.warnings += result.warning_count;
    outcome.error_count += result.error_count;
    outcome.warning_count += result.warning_count;

    if (!result.success) {
        record_failure(outcome, step, ErrorKind::NON_ZERO_EXIT, result.exit_code,
                       action + " " + step + " failed (exit code "
                       + std::to_string(result.exit_code) + ")");
    }

    return result;
}

void BuildOrchestrator::record_failure(ActionOutcome& outcome, const std::string& step,
                                       ErrorKind kind, int exit_code, const std::string& summary) {
    outcome.success = false;
    outcome.failed_step = step;
    outcome.error = kind;
    outcome.exit_code = exit_code;
    outcome.summary = summary;

    ctx_.session.errors++;
    ctx_.metrics.record_error();
    ctx_.events.record(Severity::ERROR, summary);
}

void BuildOrchestrator::flush_metrics() {
    if (!ctx_.metrics.save()) {
        ctx_.events.record(Severity::ERROR, "Failed to persist metrics to "
                           + ctx_.metrics.file_path().string());
    }
}

void BuildOrchestrator::report_progress(const std::string& action, const std::string& step,
                                        const std::string& message) {
    ctx_.events.record(Severity::INFO, message);
    if (progress_cb_) {
        ActionProgress progress;
        progress.action = action;
        progress.step = step;
        progress.message = message;
        progress_cb_(progress);
    }
}

} // namespace ignite::build
