#include "core/command_runner.hpp"
#include "core/errors.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <errno.h>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

namespace ignite::build {

namespace {

// Written by the child into the exec-status pipe when it cannot exec
struct SpawnFailure {
    int stage;   // 0 = chdir, 1 = exec
    int error;   // errno
};

constexpr int STAGE_CHDIR = 0;
constexpr int STAGE_EXEC = 1;

constexpr int POLL_INTERVAL_MS = 50;

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

bool is_executable_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

int decode_exit_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

std::string format_command(const std::string& program, const std::vector<std::string>& args) {
    std::ostringstream oss;
    oss << program;
    for (const auto& arg : args) {
        oss << ' ' << arg;
    }
    return oss.str();
}

CommandRunner::CommandRunner(EventSink& events, const CancellationToken* cancel)
    : events_(events)
    , cancel_(cancel)
    , default_classifier_(make_default_classifier()) {
}

void CommandRunner::set_default_classifier(std::unique_ptr<OutputClassifier> classifier) {
    if (classifier) {
        default_classifier_ = std::move(classifier);
    }
}

void CommandRunner::register_classifier(const std::string& program,
                                        std::unique_ptr<OutputClassifier> classifier) {
    std::string key = fs::path(program).filename().string();
    if (classifier) {
        classifiers_[key] = std::move(classifier);
    } else {
        classifiers_.erase(key);
    }
}

const OutputClassifier& CommandRunner::classifier_for(const std::string& program) const {
    auto it = classifiers_.find(fs::path(program).filename().string());
    if (it != classifiers_.end()) {
        return *it->second;
    }
    return *default_classifier_;
}

bool CommandRunner::is_available(const std::string& program) const {
    if (program.empty()) {
        return false;
    }

    if (program.find('/') != std::string::npos) {
        return is_executable_file(program);
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return false;
    }

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        if (is_executable_file(dir + "/" + program)) {
            return true;
        }
    }
    return false;
}

CommandResult CommandRunner::execute(const std::string& program,
                                     const std::vector<std::string>& args,
                                     const fs::path& working_directory) {
    return run(program, args, working_directory, true);
}

std::optional<std::string> CommandRunner::capture_version(const std::string& program,
                                                          const fs::path& working_directory) {
    CommandResult result;
    try {
        result = run(program, {"--version"}, working_directory, false);
    } catch (const ExecutionError&) {
        return std::nullopt;
    }

    if (!result.success) {
        return std::nullopt;
    }

    std::istringstream lines(result.output);
    std::string line;
    while (std::getline(lines, line)) {
        line.erase(0, line.find_first_not_of(" \t\r"));
        line.erase(line.find_last_not_of(" \t\r") + 1);
        if (!line.empty()) {
            return line;
        }
    }
    return std::nullopt;
}

CommandResult CommandRunner::run(const std::string& program,
                                 const std::vector<std::string>& args,
                                 const fs::path& working_directory,
                                 bool notify_observer) {
    auto start_time = std::chrono::steady_clock::now();
    std::string command_line = format_command(program, args);

    if (cancellation_requested()) {
        throw InterruptedError("Cancelled before starting: " + command_line);
    }

    events_.record(Severity::INFO, "Executing: " + command_line);

    int output_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (pipe(output_pipe) != 0) {
        int err = errno;
        throw ExecutionError("Failed to create output pipe: " + std::string(strerror(err)),
                             elapsed_since(start_time));
    }

    if (pipe(status_pipe) != 0) {
        int err = errno;
        close_pipe(output_pipe);
        throw ExecutionError("Failed to create status pipe: " + std::string(strerror(err)),
                             elapsed_since(start_time));
    }
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    // Everything the child needs is prepared before fork
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(program);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::string cwd = working_directory.string();

    pid_t pid = fork();

    if (pid < 0) {
        int err = errno;
        close_pipe(output_pipe);
        close_pipe(status_pipe);
        throw ExecutionError("Failed to fork process: " + std::string(strerror(err)),
                             elapsed_since(start_time));
    }

    if (pid == 0) {
        // Child process: own process group so cancellation reaches grandchildren
        setpgid(0, 0);

        dup2(output_pipe[1], STDOUT_FILENO);
        dup2(output_pipe[1], STDERR_FILENO);
        close(output_pipe[0]);
        close(output_pipe[1]);
        close(status_pipe[0]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            SpawnFailure failure{STAGE_CHDIR, errno};
            ssize_t ignored = write(status_pipe[1], &failure, sizeof(failure));
            (void)ignored;
            _exit(127);
        }

        execvp(argv[0], argv.data());

        // If we get here, execvp failed
        SpawnFailure failure{STAGE_EXEC, errno};
        ssize_t ignored = write(status_pipe[1], &failure, sizeof(failure));
        (void)ignored;
        _exit(127);  // Use _exit to avoid flushing parent's buffers
    }

    // Parent process
    setpgid(pid, pid);
    close(output_pipe[1]);
    close(status_pipe[1]);

    // Blocks until exec succeeds (pipe closed by FD_CLOEXEC) or the child reports
    SpawnFailure failure{};
    ssize_t status_bytes;
    do {
        status_bytes = read(status_pipe[0], &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close(output_pipe[0]);

        std::string what = failure.stage == STAGE_CHDIR
            ? "Cannot enter working directory " + cwd + ": "
            : "Failed to execute " + program + ": ";
        what += strerror(failure.error);

        events_.record(Severity::ERROR, what);
        throw ExecutionError(what, elapsed_since(start_time));
    }

    CommandResult result;
    const OutputClassifier& classifier = classifier_for(program);

    auto handle_line = [&](std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        Severity severity = classifier.classify(line);
        if (severity == Severity::ERROR) {
            result.error_count++;
        } else if (severity == Severity::WARNING) {
            result.warning_count++;
        }

        result.output += line;
        result.output += '\n';

        events_.record(severity, line);
        if (notify_observer && observer_) {
            observer_(severity, line);
        }
    };

    // Stream output until EOF
    std::string pending;
    char buffer[4096];
    bool open = true;

    while (open) {
        if (cancellation_requested()) {
            close(output_pipe[0]);
            terminate_child(pid);
            events_.record(Severity::WARNING, "Interrupted: " + command_line);
            throw InterruptedError("Interrupted: " + command_line);
        }

        struct pollfd pfd;
        pfd.fd = output_pipe[0];
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(output_pipe[0], buffer, sizeof(buffer));
        if (n > 0) {
            pending.append(buffer, static_cast<size_t>(n));

            size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                handle_line(pending.substr(0, newline));
                pending.erase(0, newline + 1);
            }
        } else if (n == 0) {
            open = false;
        } else if (errno != EINTR && errno != EAGAIN) {
            open = false;
        }
    }
    close(output_pipe[0]);

    // Unterminated final line
    if (!pending.empty()) {
        handle_line(pending);
    }

    // Output closed; the child may still be running (daemonized stdout)
    int status = 0;
    bool status_known = false;
    while (true) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            status_known = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            // Child already reaped elsewhere (e.g. SIGCHLD ignored): outcome unknown
            events_.record(Severity::WARNING, "Cannot collect exit status of " + command_line
                           + ": " + std::strerror(errno));
            break;
        }
        if (cancellation_requested()) {
            terminate_child(pid);
            events_.record(Severity::WARNING, "Interrupted: " + command_line);
            throw InterruptedError("Interrupted: " + command_line);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    result.exit_code = status_known ? decode_exit_status(status) : -1;
    result.success = (result.exit_code == 0);
    result.duration = elapsed_since(start_time);

    events_.record(result.success ? Severity::INFO : Severity::ERROR,
                   command_line + " - exit code " + std::to_string(result.exit_code)
                   + " (" + std::to_string(result.duration.count()) + "ms)");

    return result;
}

void CommandRunner::terminate_child(int pid) {
    if (kill(-pid, SIGTERM) != 0) {
        kill(pid, SIGTERM);
    }

    auto deadline = std::chrono::steady_clock::now() + termination_grace_;
    int status;

    while (std::chrono::steady_clock::now() < deadline) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid || (waited < 0 && errno != EINTR)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (kill(-pid, SIGKILL) != 0) {
        kill(pid, SIGKILL);
    }
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

} // namespace ignite::build
