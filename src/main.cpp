/**
 * main.cpp
 * ignite_build - Ignite Build Orchestrator CLI
 *
 * Usage:
 *   ignite_build <command> [options]
 *
 * Commands:
 *   build       Build the bootloader (default)
 *   test        Run the test suite
 *   check       Run verification tools
 *   dist        Build and stage the distribution tree
 *   clean       Remove build output
 *   doctor      Environment and health report
 *   logs        List recent event logs
 *
 * Options:
 *   -C <dir>    Change to directory before running
 *   -c <file>   Use specified config file (default: ignite.abc)
 *   -v          Echo every tool output line
 *   -q          Quiet mode
 *   --help      Show this help
 *   --version   Show version
 *
 * Copyright (c) 2025 Redstone OS Project
 */

#include "core/build_orchestrator.hpp"
#include "core/timestamp.hpp"

#include <csignal>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <signal.h>

using namespace ignite::build;

namespace {

constexpr int EXIT_INTERRUPTED = 130;

// Set from the SIGINT handler, polled by CommandRunner
CancellationToken g_cancel;

void handle_sigint(int) {
    g_cancel.request();
}

void install_signal_handler() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_sigint;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
}

} // namespace

// -----------------------------------------------------------------------------
// Version and Help
// -----------------------------------------------------------------------------

void print_version() {
    std::cout << "ignite_build 0.4.0\n";
    std::cout << "Ignite Build Orchestrator\n";
    std::cout << "Copyright (c) 2025 Redstone OS Project\n";
}

void print_help() {
    std::cout << R"(
ignite_build - Ignite Build Orchestrator

USAGE:
    ignite_build [COMMAND] [OPTIONS]

COMMANDS:
    build       Build the bootloader (default if no command given)
    test        Run the test suite
    check       Run verification tools (static check, format, lint, ...)
    dist        Build and stage a bootable distribution tree
    clean       Remove build output
    doctor      Show toolchain, project and health diagnostics
    logs        List the most recent event logs

OPTIONS:
    --profile <P>       debug | release | verbose (build: debug, dist: release)
    --features <a,b>    Comma-separated feature list (build)
    --kind <K>          test: all | unit | integration
                        check: static | format | lint | all
    --serial            Run tests on a single thread
    --full              clean: also drop the result cache and dist tree

    -C <dir>            Change to directory before running
    -c, --config <file> Use specified config file (default: ignite.abc)
    -v, --verbose       Echo every tool output line
    -q, --quiet         Quiet mode (minimal output)

    -h, --help          Show this help message
    --version           Show version information

EXAMPLES:
    ignite_build                        Debug build
    ignite_build build --profile release
    ignite_build test --kind unit --serial
    ignite_build check --kind all
    ignite_build dist                   Release build + dist/ + manifest.json
    ignite_build clean --full

CONFIG FILE FORMAT (ignite.abc):
    [project]
    name = "ignite"
    version = "0.4.0"

    [toolchain]
    target = "x86_64-unknown-uefi"

    [paths]
    dist_dir = "dist"

EXIT STATUS:
    0 on success, 1 on failure, 130 when interrupted (Ctrl-C)

)";
}

// -----------------------------------------------------------------------------
// Progress Reporter
// -----------------------------------------------------------------------------

class ConsoleProgress {
public:
    explicit ConsoleProgress(bool quiet = false)
        : quiet_(quiet) {}

    void operator()(const ActionProgress& progress) {
        if (quiet_) return;
        std::cout << "[" << progress.action << "/" << progress.step << "] "
                  << progress.message << "...\n";
    }

private:
    bool quiet_;
};

// Tool output echo: warnings and errors always, the rest only when verbose
class ConsoleEcho {
public:
    ConsoleEcho(bool verbose, bool quiet)
        : verbose_(verbose), quiet_(quiet) {}

    void operator()(Severity severity, const std::string& line) {
        if (quiet_) return;
        if (severity == Severity::ERROR || severity == Severity::WARNING) {
            std::cerr << "  " << line << "\n";
        } else if (verbose_) {
            std::cout << "  " << line << "\n";
        }
    }

private:
    bool verbose_;
    bool quiet_;
};

// -----------------------------------------------------------------------------
// Argument Parsing
// -----------------------------------------------------------------------------

enum class Command {
    BUILD,
    TEST,
    CHECK,
    DIST,
    CLEAN,
    DOCTOR,
    LOGS
};

struct Options {
    Command command = Command::BUILD;
    fs::path project_root;
    fs::path config_file = DEFAULT_CONFIG_FILE;

    std::optional<BuildProfile> profile;
    std::vector<std::string> features;
    TestKind test_kind = TestKind::ALL;
    CheckKind check_kind = CheckKind::ALL;
    bool serial = false;
    bool full_clean = false;

    bool verbose = false;
    bool quiet = false;
    bool show_help = false;
    bool show_version = false;

    // --kind is interpreted once the command is known
    std::string kind_text;
};

std::vector<std::string> split_features(const std::string& text) {
    std::vector<std::string> features;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (!item.empty()) {
            features.push_back(item);
        }
    }
    return features;
}

bool parse_args(int argc, char* argv[], Options& opts) {
    opts.project_root = fs::current_path();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Help and version
        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return true;
        }
        if (arg == "--version") {
            opts.show_version = true;
            return true;
        }

        // Commands
        if (arg == "build") {
            opts.command = Command::BUILD;
            continue;
        }
        if (arg == "test") {
            opts.command = Command::TEST;
            continue;
        }
        if (arg == "check") {
            opts.command = Command::CHECK;
            continue;
        }
        if (arg == "dist") {
            opts.command = Command::DIST;
            continue;
        }
        if (arg == "clean") {
            opts.command = Command::CLEAN;
            continue;
        }
        if (arg == "doctor") {
            opts.command = Command::DOCTOR;
            continue;
        }
        if (arg == "logs") {
            opts.command = Command::LOGS;
            continue;
        }

        // Options with arguments
        if (arg == "-C" && i + 1 < argc) {
            opts.project_root = argv[++i];
            continue;
        }
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            opts.config_file = argv[++i];
            continue;
        }
        if (arg == "--profile" && i + 1 < argc) {
            std::string value = argv[++i];
            opts.profile = parse_build_profile(value);
            if (!opts.profile) {
                std::cerr << "Unknown profile: " << value << " (expected debug, release or verbose)\n";
                return false;
            }
            continue;
        }
        if (arg == "--features" && i + 1 < argc) {
            opts.features = split_features(argv[++i]);
            continue;
        }
        if (arg == "--kind" && i + 1 < argc) {
            opts.kind_text = argv[++i];
            continue;
        }

        // Boolean options
        if (arg == "--serial") {
            opts.serial = true;
            continue;
        }
        if (arg == "--full") {
            opts.full_clean = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
            continue;
        }

        std::cerr << "Unknown argument: " << arg << "\n";
        std::cerr << "Try 'ignite_build --help' for more information.\n";
        return false;
    }

    if (!opts.kind_text.empty()) {
        if (opts.command == Command::TEST) {
            auto kind = parse_test_kind(opts.kind_text);
            if (!kind) {
                std::cerr << "Unknown test kind: " << opts.kind_text << "\n";
                return false;
            }
            opts.test_kind = *kind;
        } else if (opts.command == Command::CHECK) {
            auto kind = parse_check_kind(opts.kind_text);
            if (!kind) {
                std::cerr << "Unknown check kind: " << opts.kind_text << "\n";
                return false;
            }
            opts.check_kind = *kind;
        } else {
            std::cerr << "--kind only applies to test and check\n";
            return false;
        }
    }

    return true;
}

// -----------------------------------------------------------------------------
// Reporting
// -----------------------------------------------------------------------------

void print_failure(const ActionOutcome& outcome) {
    std::cerr << "  Failed step: " << (outcome.failed_step.empty() ? "-" : outcome.failed_step)
              << " (" << error_kind_to_string(outcome.error);
    if (outcome.error == ErrorKind::NON_ZERO_EXIT) {
        std::cerr << ", exit code " << outcome.exit_code;
    }
    std::cerr << ")\n";
}

void print_outcome(const ActionOutcome& outcome) {
    std::cout << "\n" << (outcome.success ? "OK: " : "FAILED: ") << outcome.summary
              << " (" << outcome.duration.count() << "ms";
    if (outcome.error_count > 0 || outcome.warning_count > 0) {
        std::cout << ", " << outcome.error_count << " errors, "
                  << outcome.warning_count << " warnings";
    }
    std::cout << ")\n";
    if (!outcome.success) {
        print_failure(outcome);
    }
}

void print_check(const CheckOutcome& outcome) {
    for (const auto& item : outcome.items) {
        std::cout << "  " << std::left << std::setw(22) << item.name
                  << step_status_to_string(item.status);
        if (!item.detail.empty()) {
            std::cout << " (" << item.detail << ")";
        }
        std::cout << "\n";
    }
}

void print_diagnostics(const DiagnosticReport& report) {
    std::cout << "Toolchain:\n";
    for (const auto& tool : report.tools) {
        std::cout << "  " << (tool.available ? "[ok]      " : "[missing] ")
                  << tool.name << ": " << tool.detail << "\n";
    }

    std::cout << "\nProject: " << report.project_root.string() << "\n";
    std::cout << "  Descriptor:  " << (report.descriptor_present ? "present" : "MISSING") << "\n";
    std::cout << "  Test files:  " << report.test_file_count << "\n";
    std::cout << "  Event logs:  " << report.log_file_count << "\n";

    std::cout << "\nHistory (" << load_status_to_string(report.metrics_status) << "):\n";
    std::cout << "  Builds: " << report.history.total_builds
              << "  Tests: " << report.history.total_tests
              << "  Errors: " << report.history.total_errors << "\n";
    std::cout << std::fixed << std::setprecision(2);
    if (report.average_build_seconds) {
        std::cout << "  Average build: " << *report.average_build_seconds << "s\n";
    }
    if (report.average_test_seconds) {
        std::cout << "  Average test:  " << *report.average_test_seconds << "s\n";
    }
    std::cout << "  Last success: " << report.history.last_success.value_or("never") << "\n";

    std::cout << "\nHealth: " << report.health.score << "/100 ("
              << health_tier_to_string(report.tier) << ")\n";
    for (const auto& issue : report.health.issues) {
        std::cout << "  - " << issue << "\n";
    }
}

void print_logs(const std::vector<LogFileInfo>& logs) {
    if (logs.empty()) {
        std::cout << "No event logs.\n";
        return;
    }
    std::cout << "Recent event logs:\n";
    for (const auto& log : logs) {
        std::cout << "  " << std::left << std::setw(32) << log.name
                  << std::right << std::setw(10) << log.size_bytes << " bytes  "
                  << display_local_time(log.modified) << "\n";
    }
}

void print_session_summary(const SessionStats& session) {
    std::cout << "\nSession: " << session.builds << " builds, "
              << session.tests << " tests, "
              << session.checks << " checks, "
              << session.commands_run << " commands, "
              << session.errors << " errors, "
              << session.warnings << " warnings, "
              << session.cache_hits << " cache hits ("
              << session.elapsed().count() << "s)\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------

int run_command(const Options& opts, BuildOrchestrator& orchestrator) {
    switch (opts.command) {
        case Command::BUILD: {
            BuildOutcome outcome = orchestrator.build(opts.profile.value_or(BuildProfile::DEBUG),
                                                      opts.features);
            if (!opts.quiet) {
                print_outcome(outcome);
                if (outcome.artifact) {
                    std::cout << "  Artifact: " << outcome.artifact->path.string() << "\n";
                    std::cout << "  SHA-256:  " << outcome.artifact->sha256 << "\n";
                }
            }
            return outcome.success ? 0 : 1;
        }

        case Command::TEST: {
            TestOutcome outcome = orchestrator.test(opts.test_kind, !opts.serial);
            if (!opts.quiet) {
                if (!outcome.result_line.empty()) {
                    std::cout << "  " << outcome.result_line << "\n";
                }
                print_outcome(outcome);
            }
            return outcome.success ? 0 : 1;
        }

        case Command::CHECK: {
            CheckOutcome outcome = orchestrator.check(opts.check_kind);
            if (!opts.quiet) {
                std::cout << "\n";
                print_check(outcome);
                print_outcome(outcome);
            }
            return outcome.success ? 0 : 1;
        }

        case Command::DIST: {
            DistributionOutcome outcome = orchestrator.distribute(
                opts.profile.value_or(BuildProfile::RELEASE));
            if (!opts.quiet) {
                print_outcome(outcome);
                if (outcome.manifest) {
                    std::cout << "  Manifest: " << outcome.manifest_path.string() << "\n";
                    std::cout << "  SHA-256:  " << outcome.manifest->binary_hash << "\n";
                }
            }
            return outcome.success ? 0 : 1;
        }

        case Command::CLEAN: {
            CleanOutcome outcome = orchestrator.clean(opts.full_clean ? CleanScope::FULL
                                                                      : CleanScope::STANDARD);
            if (!opts.quiet) {
                print_outcome(outcome);
            }
            return outcome.success ? 0 : 1;
        }

        case Command::DOCTOR: {
            DiagnosticReport report = orchestrator.diagnose();
            print_diagnostics(report);
            return 0;
        }

        case Command::LOGS: {
            print_logs(orchestrator.recent_logs());
            return 0;
        }
    }

    return 0;
}

int main(int argc, char* argv[]) {
    Options opts;

    if (!parse_args(argc, argv, opts)) {
        return 1;
    }

    if (opts.show_help) {
        print_help();
        return 0;
    }

    if (opts.show_version) {
        print_version();
        return 0;
    }

    install_signal_handler();

    SessionStats session;

    try {
        // Configuration
        ConfigLoadResult loaded = load_project_config(fs::absolute(opts.project_root),
                                                      opts.config_file);
        for (const auto& warning : loaded.warnings) {
            std::cerr << "Config warning: " << warning << "\n";
        }
        ProjectConfig config = loaded.config;
        if (opts.verbose) {
            config.verbose = true;
        }

        // Session state
        EventLog events(config.resolve(config.log_dir), session.session_start);

        MetricsStore metrics(config.resolve(config.state_dir));
        LoadStatus status = metrics.load();
        if (status == LoadStatus::CORRUPT) {
            std::cerr << "Warning: metrics file was corrupt and has been reset (moved to "
                      << metrics.file_path().string() << MetricsStore::CORRUPT_SUFFIX << ")\n";
        }

        ResultCache cache(config.cache_dir(), session);

        CommandRunner runner(events, &g_cancel);
        runner.set_line_observer(ConsoleEcho(config.verbose, opts.quiet));

        OrchestratorContext context{runner, cache, metrics, session, events};
        BuildOrchestrator orchestrator(config, context);
        orchestrator.set_progress_callback(ConsoleProgress(opts.quiet));

        int exit_code = 0;
        try {
            exit_code = run_command(opts, orchestrator);
        } catch (const InterruptedError& e) {
            events.record(Severity::WARNING, std::string("Interrupted: ") + e.what());
            std::cerr << "\nInterrupted: " << e.what() << "\n";
            if (!opts.quiet) {
                print_session_summary(session);
            }
            return EXIT_INTERRUPTED;
        }

        if (!opts.quiet && opts.command != Command::LOGS) {
            print_session_summary(session);
            std::cout << "Event log: " << events.path().string() << "\n";
        }
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
