// test_command_runner.cpp - Tests for CommandRunner and output classification
// Part of ignite_build - Ignite Build Orchestrator

#include "test_harness.hpp"

#include "core/command_runner.hpp"
#include "core/errors.hpp"
#include "core/output_classifier.hpp"

#include <chrono>
#include <cstring>
#include <memory>
#include <thread>

#include <signal.h>

using namespace ignite::build;

static std::unique_ptr<TempDir> fixture;

// =============================================================================
// Classifier Tests
// =============================================================================

void test_default_classifier_markers() {
    auto classifier = make_default_classifier();
    ASSERT(classifier->classify("error: expected `;`") == Severity::ERROR);
    ASSERT(classifier->classify("error[E0425]: cannot find value") == Severity::ERROR);
    ASSERT(classifier->classify("warning: unused variable `x`") == Severity::WARNING);
    ASSERT(classifier->classify("warning[unused]: oops") == Severity::WARNING);
    ASSERT(classifier->classify("   Compiling ignite v0.4.0") == Severity::INFO);
    ASSERT(classifier->classify("") == Severity::INFO);
}

void test_classifier_case_insensitive() {
    auto classifier = make_default_classifier();
    ASSERT(classifier->classify("ERROR: link failed") == Severity::ERROR);
    ASSERT(classifier->classify("Warning: deprecated") == Severity::WARNING);
}

void test_classifier_error_precedence() {
    auto classifier = make_default_classifier();
    ASSERT(classifier->classify("warning: treated as error: yes") == Severity::ERROR);
}

// =============================================================================
// Execution Tests
// =============================================================================

void test_success_with_error_line() {
    fs::path tool = write_script(fixture->path / "zero_with_error.sh",
                                 "echo 'error: something odd'\n"
                                 "echo 'all done'\n"
                                 "exit 0\n");

    RecordingSink sink;
    CommandRunner runner(sink);
    CommandResult result = runner.execute(tool.string(), {});

    ASSERT(result.success);
    ASSERT_EQ(result.exit_code, 0);
    ASSERT_EQ(result.error_count, size_t(1));
    ASSERT_EQ(result.warning_count, size_t(0));
    ASSERT_EQ(result.output, std::string("error: something odd\nall done\n"));
}

void test_nonzero_exit() {
    fs::path tool = write_script(fixture->path / "fails.sh",
                                 "echo 'warning: first'\n"
                                 "exit 3\n");

    RecordingSink sink;
    CommandRunner runner(sink);
    CommandResult result = runner.execute(tool.string(), {});

    ASSERT(!result.success);
    ASSERT_EQ(result.exit_code, 3);
    ASSERT_EQ(result.warning_count, size_t(1));
    ASSERT(sink.contains("exit code 3"));
}

// Restores the previous SIGCHLD disposition on scope exit
class IgnoredSigchld {
public:
    IgnoredSigchld() {
        struct sigaction ignore;
        std::memset(&ignore, 0, sizeof(ignore));
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGCHLD, &ignore, &previous_);
    }
    ~IgnoredSigchld() { sigaction(SIGCHLD, &previous_, nullptr); }

private:
    struct sigaction previous_;
};

void test_unreaped_status_is_not_success() {
    RecordingSink sink;
    CommandRunner runner(sink);
    CommandResult result;
    {
        // The kernel reaps the child and waitpid reports ECHILD
        IgnoredSigchld guard;
        result = runner.execute("/bin/sh", {"-c", "echo out; exit 3"});
    }

    ASSERT(!result.success);
    ASSERT_EQ(result.exit_code, -1);
    ASSERT_EQ(result.output, std::string("out\n"));
    ASSERT(sink.contains("Cannot collect exit status"));
}

void test_missing_program_throws() {
    RecordingSink sink;
    CommandRunner runner(sink);

    bool caught = false;
    try {
        runner.execute("ignite-build-no-such-tool-xyz", {"--flag"});
    } catch (const ExecutionError& e) {
        caught = true;
        ASSERT(e.elapsed().count() >= 0);
    }
    ASSERT(caught);
    ASSERT(sink.contains("ignite-build-no-such-tool-xyz"));
}

void test_missing_working_directory_throws() {
    RecordingSink sink;
    CommandRunner runner(sink);
    ASSERT_THROWS(runner.execute("/bin/sh", {"-c", "true"}, fixture->path / "does_not_exist"),
                  ExecutionError);
}

void test_arguments_and_working_directory() {
    fs::path workdir = fixture->path / "work";
    fs::create_directories(workdir);
    write_text(workdir / "marker.txt", "present\n");

    RecordingSink sink;
    CommandRunner runner(sink);
    CommandResult result = runner.execute("/bin/sh", {"-c", "cat marker.txt; echo \"$0 $1\"", "a b", "c"},
                                          workdir);

    ASSERT(result.success);
    ASSERT_EQ(result.output, std::string("present\na b c\n"));
}

void test_stderr_merged_in_order() {
    fs::path tool = write_script(fixture->path / "mixed.sh",
                                 "echo one\n"
                                 "echo 'warning: two' 1>&2\n"
                                 "echo three\n"
                                 "printf 'error: four'\n");

    RecordingSink sink;
    std::vector<std::string> observed;

    CommandRunner runner(sink);
    runner.set_line_observer([&observed](Severity, const std::string& line) {
        observed.push_back(line);
    });
    CommandResult result = runner.execute(tool.string(), {});

    ASSERT(result.success);
    ASSERT_EQ(observed.size(), size_t(4));
    ASSERT_EQ(observed[0], std::string("one"));
    ASSERT_EQ(observed[1], std::string("warning: two"));
    ASSERT_EQ(observed[2], std::string("three"));
    ASSERT_EQ(observed[3], std::string("error: four"));
    ASSERT_EQ(result.warning_count, size_t(1));
    ASSERT_EQ(result.error_count, size_t(1));

    // Sink sees the same lines in the same order, tagged
    std::vector<std::string> sunk;
    for (const auto& r : sink.records) {
        if (r.second == "one" || r.second == "warning: two"
            || r.second == "three" || r.second == "error: four") {
            sunk.push_back(r.second);
        }
    }
    ASSERT(sunk == observed);
    for (const auto& r : sink.records) {
        if (r.second == "warning: two") ASSERT(r.first == Severity::WARNING);
        if (r.second == "error: four") ASSERT(r.first == Severity::ERROR);
    }
}

void test_registered_classifier() {
    fs::path tool = write_script(fixture->path / "custom_tool.sh",
                                 "echo 'FATAL thing'\n"
                                 "echo 'error: not an error here'\n");

    RecordingSink sink;
    CommandRunner runner(sink);
    runner.register_classifier("custom_tool.sh",
        std::make_unique<SubstringClassifier>(std::vector<std::string>{"fatal"},
                                              std::vector<std::string>{}));

    CommandResult result = runner.execute(tool.string(), {});
    ASSERT_EQ(result.error_count, size_t(1));
    ASSERT_EQ(result.warning_count, size_t(0));
}

void test_duration_measured() {
    RecordingSink sink;
    CommandRunner runner(sink);
    CommandResult result = runner.execute("/bin/sh", {"-c", "sleep 0.2"});

    ASSERT(result.success);
    ASSERT(result.duration >= std::chrono::milliseconds(150));
    ASSERT(result.duration_seconds() > 0.1);
}

void test_capture_version() {
    fs::path tool = write_script(fixture->path / "versioned.sh",
                                 "echo\n"
                                 "echo 'versioned 1.2.3 (abc 2025-01-01)'\n");

    RecordingSink sink;
    CommandRunner runner(sink);

    auto version = runner.capture_version(tool.string());
    ASSERT(version.has_value());
    ASSERT_EQ(*version, std::string("versioned 1.2.3 (abc 2025-01-01)"));

    ASSERT(!runner.capture_version("ignite-build-no-such-tool-xyz").has_value());

    fs::path failing = write_script(fixture->path / "version_fails.sh", "exit 1\n");
    ASSERT(!runner.capture_version(failing.string()).has_value());
}

void test_is_available() {
    RecordingSink sink;
    CommandRunner runner(sink);
    ASSERT(runner.is_available("sh"));
    ASSERT(runner.is_available("/bin/sh"));
    ASSERT(!runner.is_available("ignite-build-no-such-tool-xyz"));
    ASSERT(!runner.is_available((fixture->path / "nothing_here").string()));
}

// =============================================================================
// Cancellation Tests
// =============================================================================

void test_cancelled_before_start() {
    RecordingSink sink;
    CancellationToken token;
    token.request();

    CommandRunner runner(sink, &token);
    ASSERT_THROWS(runner.execute("/bin/sh", {"-c", "true"}), InterruptedError);
}

void test_cancel_running_child() {
    RecordingSink sink;
    CancellationToken token;

    CommandRunner runner(sink, &token);
    runner.set_termination_grace(std::chrono::milliseconds(500));

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.request();
    });

    auto start = std::chrono::steady_clock::now();
    bool interrupted = false;
    try {
        runner.execute("/bin/sh", {"-c", "echo started; sleep 10"});
    } catch (const InterruptedError&) {
        interrupted = true;
    }
    canceller.join();

    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT(interrupted);
    ASSERT(elapsed < std::chrono::seconds(5));
    ASSERT(sink.contains("Interrupted"));
}

void test_format_command() {
    ASSERT_EQ(format_command("cargo", {"build", "--release"}), std::string("cargo build --release"));
    ASSERT_EQ(format_command("rustup", {}), std::string("rustup"));
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== CommandRunner Test Suite ===\n\n";

    fixture = std::make_unique<TempDir>("runner");

    std::cout << "Classifier Tests:\n";
    TEST(default_classifier_markers);
    TEST(classifier_case_insensitive);
    TEST(classifier_error_precedence);

    std::cout << "\nExecution Tests:\n";
    TEST(success_with_error_line);
    TEST(nonzero_exit);
    TEST(unreaped_status_is_not_success);
    TEST(missing_program_throws);
    TEST(missing_working_directory_throws);
    TEST(arguments_and_working_directory);
    TEST(stderr_merged_in_order);
    TEST(registered_classifier);
    TEST(duration_measured);
    TEST(capture_version);
    TEST(is_available);
    TEST(format_command);

    std::cout << "\nCancellation Tests:\n";
    TEST(cancelled_before_start);
    TEST(cancel_running_child);

    fixture.reset();

    TEST_SUMMARY();
    return (tests_passed == tests_run) ? 0 : 1;
}
