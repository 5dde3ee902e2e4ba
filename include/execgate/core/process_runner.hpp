/*
 * execgate C++17 - Process Runner
 *
 * Spawns a validated command as its own process group with an explicit
 * argument vector (fork + execv, never a shell), stdin on /dev/null,
 * stdout/stderr captured into capped buffers and a wall-clock watchdog that
 * SIGKILLs the whole group when the deadline passes.
 *
 * Timeouts come back as ExecutionResult::timed_out, not as failures. A
 * RunOutcome only fails when the OS refuses to start the program.
 */
#ifndef execgate_CORE_PROCESS_RUNNER_HPP
#define execgate_CORE_PROCESS_RUNNER_HPP

#include <execgate/core/types.hpp>
#include <execgate/core/errors.hpp>
#include <execgate/core/policy.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <cstdint>

namespace execgate {

struct RunOutcome {
    bool success;               // Process was started (it may still have failed or timed out)
    ExecutionResult result;
    ErrorKind kind;             // SPAWN_FAILED / PERMISSION_DENIED
    std::string error;          // OS detail

    RunOutcome() : success(false), kind(ErrorKind::NONE) {}

    static RunOutcome ok(const ExecutionResult& r) {
        RunOutcome o;
        o.success = true;
        o.result = r;
        return o;
    }

    static RunOutcome fail(ErrorKind k, const std::string& detail) {
        RunOutcome o;
        o.kind = k;
        o.error = detail;
        return o;
    }
};

// ============================================================================
// Output Capture
// ============================================================================

/**
 * OutputCapture - Two buffers sharing one byte budget
 *
 * Bytes are appended verbatim until stdout + stderr would exceed the budget.
 * The write that crosses the line is cut, `truncated` is set and the marker
 * is appended to that stream. The marker is counted inside the budget, so
 * the combined size never exceeds max_bytes. Later writes are discarded.
 */
class OutputCapture {
public:
    static const char* const TRUNCATION_MARKER;

    explicit OutputCapture(size_t max_bytes);

    void append_stdout(const char* data, size_t len) { append(stdout_, data, len); }
    void append_stderr(const char* data, size_t len) { append(stderr_, data, len); }

    bool truncated() const { return truncated_; }
    size_t total_size() const { return stdout_.size() + stderr_.size(); }

    std::string& stdout_data() { return stdout_; }
    std::string& stderr_data() { return stderr_; }

private:
    void append(std::string& target, const char* data, size_t len);

    size_t max_bytes_;
    size_t data_limit_;     // max_bytes_ minus room for the marker
    bool truncated_;
    std::string stdout_;
    std::string stderr_;
};

// ============================================================================
// Runner Interface
// ============================================================================

class ProcessRunner {
public:
    virtual ~ProcessRunner() {}

    // `working_dir` is already resolved and canonical. `timeout_seconds` is
    // the caller's request; the effective value comes from the policy.
    virtual RunOutcome run(const std::string& program,
                           const std::vector<std::string>& args,
                           const std::string& working_dir,
                           const std::optional<int64_t>& timeout_seconds,
                           const Policy& policy) = 0;
};

// ============================================================================
// POSIX Implementation
// ============================================================================

class PosixProcessRunner : public ProcessRunner {
public:
    PosixProcessRunner();

    RunOutcome run(const std::string& program,
                   const std::vector<std::string>& args,
                   const std::string& working_dir,
                   const std::optional<int64_t>& timeout_seconds,
                   const Policy& policy) override;

    // Watchdog/poll granularity in milliseconds (default 50)
    void set_poll_interval_ms(int ms) { poll_interval_ms_ = ms > 0 ? ms : 1; }

private:
    int poll_interval_ms_;
};

} // namespace execgate

#endif // execgate_CORE_PROCESS_RUNNER_HPP
