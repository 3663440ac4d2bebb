#pragma once

#include "core/event_log.hpp"
#include "core/output_classifier.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ignite::build {

namespace fs = std::filesystem;

/**
 * CancellationToken - cooperative cancellation flag
 *
 * Set from a signal handler (SIGINT) or another thread; polled by the
 * CommandRunner while a child process is running.
 */
class CancellationToken {
public:
    void request() { requested_.store(true); }
    void reset() { requested_.store(false); }
    bool requested() const { return requested_.load(); }

private:
    std::atomic<bool> requested_{false};
};

/**
 * Result of one external command invocation
 */
struct CommandResult {
    bool success = false;                    // exit_code == 0, nothing else
    int exit_code = -1;                      // 128 + signal when killed
    std::chrono::milliseconds duration{0};   // Wall clock, spawn to reap
    std::string output;                      // Merged stdout/stderr, verbatim
    size_t error_count = 0;                  // Lines classified ERROR
    size_t warning_count = 0;                // Lines classified WARNING

    double duration_seconds() const {
        return std::chrono::duration<double>(duration).count();
    }
};

using LineObserver = std::function<void(Severity, const std::string&)>;

/**
 * CommandRunner - Runs one external program at a time
 *
 * Responsibilities:
 * - Spawn the program with stdout and stderr merged into a single pipe
 * - Stream output line by line as it is produced (never buffered to exit)
 * - Classify each line with the program's OutputClassifier
 * - Forward every line, in order, to the EventSink
 * - Measure wall-clock duration
 * - Terminate the child when the CancellationToken fires
 *
 * Platform Support: POSIX (fork/exec/poll)
 */
class CommandRunner {
public:
    /**
     * @param events Durable sink receiving every output line
     * @param cancel Optional cancellation token polled during execution
     */
    explicit CommandRunner(EventSink& events, const CancellationToken* cancel = nullptr);

    /**
     * Run a program to completion
     *
     * Process:
     * 1. Fork; child joins its own process group, redirects stdout/stderr
     *    into the output pipe, changes directory, execs
     * 2. Parent reads the exec-status pipe (closed on exec) to detect spawn
     *    failures before any output is read
     * 3. Parent streams the output pipe, classifying each line
     * 4. Parent reaps the child and records the exit code
     *
     * @param program Executable name (PATH lookup) or path
     * @param args Arguments, not including the program itself
     * @param working_directory Child's working directory (empty = inherit)
     * @return CommandResult; a non-zero exit is a result, not an exception
     * @throws ExecutionError if the process could not be started
     * @throws InterruptedError if cancellation was requested
     */
    CommandResult execute(const std::string& program,
                          const std::vector<std::string>& args,
                          const fs::path& working_directory = {});

    /**
     * Run `program --version` and return its first non-empty output line
     *
     * @return nullopt if the program is missing or exits non-zero
     * @throws InterruptedError if cancellation was requested
     */
    std::optional<std::string> capture_version(const std::string& program,
                                               const fs::path& working_directory = {});

    /**
     * Test if a program resolves to an executable regular file
     *
     * Names containing '/' are checked directly, others searched on PATH.
     */
    bool is_available(const std::string& program) const;

    // Classifier used for programs without a registered one
    void set_default_classifier(std::unique_ptr<OutputClassifier> classifier);

    // Classifier for a specific program (matched on the file name)
    void register_classifier(const std::string& program,
                             std::unique_ptr<OutputClassifier> classifier);

    // Real-time observer for display; called for every line
    void set_line_observer(LineObserver observer) { observer_ = std::move(observer); }

    // Time between SIGTERM and SIGKILL on cancellation
    void set_termination_grace(std::chrono::milliseconds grace) { termination_grace_ = grace; }

private:
    EventSink& events_;
    const CancellationToken* cancel_;
    std::unique_ptr<OutputClassifier> default_classifier_;
    std::unordered_map<std::string, std::unique_ptr<OutputClassifier>> classifiers_;
    LineObserver observer_;
    std::chrono::milliseconds termination_grace_{2000};

    CommandResult run(const std::string& program,
                      const std::vector<std::string>& args,
                      const fs::path& working_directory,
                      bool notify_observer);

    const OutputClassifier& classifier_for(const std::string& program) const;

    bool cancellation_requested() const {
        return cancel_ != nullptr && cancel_->requested();
    }

    /**
     * SIGTERM the child's process group, escalate to SIGKILL after the
     * grace period, and reap it. Never leaves a zombie.
     */
    void terminate_child(int pid);
};

// Render a command line for logs: program arg1 arg2 ...
std::string format_command(const std::string& program, const std::vector<std::string>& args);

} // namespace ignite::build
