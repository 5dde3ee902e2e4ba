/*
 * execgate C++17 - Process Runner Implementation
 *
 * Child setup between fork() and execv() only uses async-signal-safe calls;
 * everything that allocates (argv, paths) is prepared before forking so the
 * runner stays correct when several gateway threads spawn at once.
 */
#include <execgate/core/process_runner.hpp>
#include <execgate/core/logger.hpp>
#include <execgate/core/utils.hpp>

#include <chrono>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace execgate {

// ============================================================================
// OutputCapture
// ============================================================================

const char* const OutputCapture::TRUNCATION_MARKER =
    "\n... [OUTPUT TRUNCATED - EXCEEDED MAX SIZE] ...\n";

OutputCapture::OutputCapture(size_t max_bytes)
    : max_bytes_(max_bytes)
    , data_limit_(max_bytes)
    , truncated_(false)
{
    size_t marker_len = strlen(TRUNCATION_MARKER);
    if (max_bytes_ > marker_len) {
        data_limit_ = max_bytes_ - marker_len;
    }
}

void OutputCapture::append(std::string& target, const char* data, size_t len) {
    if (truncated_ || len == 0) return;

    size_t used = total_size();
    size_t room = used < data_limit_ ? data_limit_ - used : 0;

    if (len <= room) {
        target.append(data, len);
        return;
    }

    target.append(data, room);
    truncated_ = true;

    // A budget too small to hold the marker keeps only the data
    if (max_bytes_ > data_limit_) {
        target.append(TRUNCATION_MARKER);
    }
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

// Stage reported back through the exec-status pipe
enum ChildStage {
    STAGE_CHDIR = 1,
    STAGE_EXEC = 2,
    STAGE_SETUP = 3
};

struct ChildFailure {
    int stage;
    int err;
};

struct Pipe {
    int read_fd;
    int write_fd;
    Pipe() : read_fd(-1), write_fd(-1) {}
};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool open_pipe(Pipe& p) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) return false;
    p.read_fd = fds[0];
    p.write_fd = fds[1];
    return true;
}

void report_and_exit(int status_fd, int stage) {
    ChildFailure f;
    f.stage = stage;
    f.err = errno;
    ssize_t ignored = write(status_fd, &f, sizeof(f));
    (void)ignored;
    _exit(127);
}

ErrorKind kind_for_errno(int err) {
    return (err == EACCES || err == EPERM) ? ErrorKind::PERMISSION_DENIED : ErrorKind::SPAWN_FAILED;
}

// Read what is available right now, at most max_reads chunks so a producer
// that never pauses cannot starve the watchdog. Returns false on EOF or hard error.
bool drain_fd(int fd, OutputCapture& capture, bool is_stdout, int max_reads) {
    char buf[8192];
    for (int reads = 0; reads < max_reads; ) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            ++reads;
            if (is_stdout) {
                capture.append_stdout(buf, static_cast<size_t>(n));
            } else {
                capture.append_stderr(buf, static_cast<size_t>(n));
            }
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        LOG_WARN("Read from child pipe failed: %s", strerror(errno));
        return false;
    }
    return true;
}

pid_t wait_child(pid_t pid, int* status, int options) {
    pid_t r;
    do {
        r = waitpid(pid, status, options);
    } while (r < 0 && errno == EINTR);
    return r;
}

void kill_group(pid_t pid) {
    // The child called setpgid(0, 0), so its pid is the group id
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        LOG_WARN("killpg(%d) failed: %s, killing leader only", static_cast<int>(pid), strerror(errno));
    }
    kill(pid, SIGKILL);
}

} // anonymous namespace

// ============================================================================
// PosixProcessRunner
// ============================================================================

PosixProcessRunner::PosixProcessRunner() : poll_interval_ms_(50) {}

RunOutcome PosixProcessRunner::run(const std::string& program,
                                   const std::vector<std::string>& args,
                                   const std::string& working_dir,
                                   const std::optional<int64_t>& timeout_seconds,
                                   const Policy& policy) {
    const int64_t timeout_s = policy.effective_timeout(timeout_seconds);

    // Locate the binary before forking; the path is absolute, so the
    // child's chdir() cannot change which file gets executed
    std::string exe_path = find_executable(program);
    if (exe_path.empty()) {
        struct stat st;
        if (program.find('/') != std::string::npos && stat(program.c_str(), &st) == 0) {
            return RunOutcome::fail(ErrorKind::PERMISSION_DENIED,
                                    "Program is not executable: " + program);
        }
        return RunOutcome::fail(ErrorKind::SPAWN_FAILED,
                                "Command not found: " + program +
                                ". Please ensure it is installed and in PATH.");
    }

    // argv[0] is the requested name; the resolved path goes to execv
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (size_t i = 0; i < args.size(); ++i) {
        argv.push_back(const_cast<char*>(args[i].c_str()));
    }
    argv.push_back(NULL);

    Pipe out_pipe, err_pipe, status_pipe;
    if (!open_pipe(out_pipe) || !open_pipe(err_pipe) || !open_pipe(status_pipe)) {
        int err = errno;
        close_fd(out_pipe.read_fd); close_fd(out_pipe.write_fd);
        close_fd(err_pipe.read_fd); close_fd(err_pipe.write_fd);
        close_fd(status_pipe.read_fd); close_fd(status_pipe.write_fd);
        return RunOutcome::fail(ErrorKind::SPAWN_FAILED, std::string("pipe failed: ") + strerror(err));
    }

    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        int err = errno;
        close_fd(out_pipe.read_fd); close_fd(out_pipe.write_fd);
        close_fd(err_pipe.read_fd); close_fd(err_pipe.write_fd);
        close_fd(status_pipe.read_fd); close_fd(status_pipe.write_fd);
        return RunOutcome::fail(ErrorKind::SPAWN_FAILED, std::string("open /dev/null failed: ") + strerror(err));
    }

    const char* exe = exe_path.c_str();
    const char* cwd = working_dir.c_str();
    const bool change_dir = !working_dir.empty();

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_fd(out_pipe.read_fd); close_fd(out_pipe.write_fd);
        close_fd(err_pipe.read_fd); close_fd(err_pipe.write_fd);
        close_fd(status_pipe.read_fd); close_fd(status_pipe.write_fd);
        close_fd(devnull);
        return RunOutcome::fail(kind_for_errno(err), std::string("fork failed: ") + strerror(err));
    }

    if (pid == 0) {
        // Child: own process group so the watchdog can take down descendants
        setpgid(0, 0);

        signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, NULL);

        if (dup2(devnull, STDIN_FILENO) < 0 ||
            dup2(out_pipe.write_fd, STDOUT_FILENO) < 0 ||
            dup2(err_pipe.write_fd, STDERR_FILENO) < 0) {
            report_and_exit(status_pipe.write_fd, STAGE_SETUP);
        }

        if (change_dir && chdir(cwd) != 0) {
            report_and_exit(status_pipe.write_fd, STAGE_CHDIR);
        }

        execv(exe, argv.data());
        report_and_exit(status_pipe.write_fd, STAGE_EXEC);
    }

    // Parent. Also set the group here to close the race with the child.
    setpgid(pid, pid);

    close_fd(out_pipe.write_fd);
    close_fd(err_pipe.write_fd);
    close_fd(status_pipe.write_fd);
    close_fd(devnull);

    // EOF on the status pipe means execv succeeded (CLOEXEC closed it)
    ChildFailure failure;
    ssize_t got;
    do {
        got = read(status_pipe.read_fd, &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    close_fd(status_pipe.read_fd);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        wait_child(pid, &status, 0);
        close_fd(out_pipe.read_fd);
        close_fd(err_pipe.read_fd);

        std::string detail;
        if (failure.stage == STAGE_CHDIR) {
            detail = "chdir to " + working_dir + " failed: ";
        } else if (failure.stage == STAGE_EXEC) {
            detail = "exec " + exe_path + " failed: ";
        } else {
            detail = "child setup failed: ";
        }
        detail += strerror(failure.err);
        LOG_ERROR("Spawn of '%s' failed: %s", program.c_str(), detail.c_str());
        return RunOutcome::fail(kind_for_errno(failure.err), detail);
    }

    LOG_DEBUG("Spawned '%s' pid=%d (%zu args, timeout=%llds, cwd=%s)",
              program.c_str(), static_cast<int>(pid), args.size(),
              static_cast<long long>(timeout_s), working_dir.c_str());

    fcntl(out_pipe.read_fd, F_SETFL, fcntl(out_pipe.read_fd, F_GETFL) | O_NONBLOCK);
    fcntl(err_pipe.read_fd, F_SETFL, fcntl(err_pipe.read_fd, F_GETFL) | O_NONBLOCK);

    OutputCapture capture(policy.max_output_bytes);
    ExecutionResult result;

    const auto deadline = start + std::chrono::seconds(timeout_s);
    bool exited = false;
    int status = 0;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            kill_group(pid);
            wait_child(pid, &status, 0);
            // Output written since the last poll is still buffered in the pipes
            if (out_pipe.read_fd >= 0) drain_fd(out_pipe.read_fd, capture, true, 1024);
            if (err_pipe.read_fd >= 0) drain_fd(err_pipe.read_fd, capture, false, 1024);
            result.timed_out = true;
            LOG_WARN("Command '%s' timed out after %llds, process group killed",
                     program.c_str(), static_cast<long long>(timeout_s));
            break;
        }

        int64_t remaining_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
        int wait_ms = static_cast<int>(remaining_ms < poll_interval_ms_ ? remaining_ms : poll_interval_ms_);

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_pipe.read_fd >= 0) {
            fds[nfds].fd = out_pipe.read_fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        if (err_pipe.read_fd >= 0) {
            fds[nfds].fd = err_pipe.read_fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }

        int pr = poll(nfds > 0 ? fds : NULL, nfds, wait_ms);
        if (pr < 0 && errno != EINTR) {
            LOG_ERROR("poll failed: %s", strerror(errno));
        }

        if (pr > 0) {
            for (nfds_t i = 0; i < nfds; ++i) {
                if (fds[i].revents == 0) continue;
                bool is_stdout = (fds[i].fd == out_pipe.read_fd);
                if (!drain_fd(fds[i].fd, capture, is_stdout, 16)) {
                    if (is_stdout) {
                        close_fd(out_pipe.read_fd);
                    } else {
                        close_fd(err_pipe.read_fd);
                    }
                }
            }
        }

        if (wait_child(pid, &status, WNOHANG) == pid) {
            exited = true;
            // Whatever the child wrote before exiting is still buffered in the pipes
            if (out_pipe.read_fd >= 0) drain_fd(out_pipe.read_fd, capture, true, 1024);
            if (err_pipe.read_fd >= 0) drain_fd(err_pipe.read_fd, capture, false, 1024);
            break;
        }
    }

    close_fd(out_pipe.read_fd);
    close_fd(err_pipe.read_fd);

    auto end = std::chrono::steady_clock::now();
    result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    result.truncated = capture.truncated();
    result.stdout_output.swap(capture.stdout_data());
    result.stderr_output.swap(capture.stderr_data());

    if (exited) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
        }
    } else if (result.timed_out) {
        result.term_signal = SIGKILL;
    }

    if (result.truncated) {
        LOG_WARN("Output of '%s' truncated at %zu bytes", program.c_str(), policy.max_output_bytes);
    }

    return RunOutcome::ok(result);
}

} // namespace execgate
