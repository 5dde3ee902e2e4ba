/*
 * execgate C++17 - Execution Gateway
 *
 * The only sanctioned path from a tool to an external process:
 *
 *   Received -> Sanitized -> Validated --(rejected)--> Rejected
 *                                |
 *                                v
 *                        WorkdirResolved --(outside roots)--> Rejected
 *                                |
 *                                v
 *                            Executing -> Completed(Success | TimedOut | Failed)
 *
 * Nothing is retried here: a process that failed or timed out is not assumed
 * to be idempotent. Errors come back as values, never as exceptions.
 */
#ifndef execgate_CORE_GATEWAY_HPP
#define execgate_CORE_GATEWAY_HPP

#include <execgate/core/types.hpp>
#include <execgate/core/errors.hpp>
#include <execgate/core/policy.hpp>
#include <execgate/core/process_runner.hpp>
#include <execgate/core/audit.hpp>
#include <execgate/core/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <optional>

namespace execgate {

enum class GatewayState {
    RECEIVED,
    SANITIZED,
    VALIDATED,
    REJECTED,
    WORKDIR_RESOLVED,
    EXECUTING,
    COMPLETED
};

enum class CompletionStatus {
    NONE,       // Not completed (rejected)
    SUCCESS,    // Exit code 0
    TIMED_OUT,  // Watchdog fired
    FAILED      // Non-zero exit, killed by a signal, or could not spawn
};

const char* gateway_state_name(GatewayState state);
const char* completion_status_name(CompletionStatus status);

struct GatewayResult {
    GatewayState state;             // REJECTED or COMPLETED once execute() returns
    std::vector<GatewayState> states;   // Every state entered, in order
    CompletionStatus status;
    bool has_result;                // A process ran and `result` is meaningful
    ExecutionResult result;
    GatewayError error;             // Set for rejections and spawn failures
    std::string working_dir;        // Resolved directory, when it got that far
    int64_t timeout_s;              // Effective timeout, when it got that far

    GatewayResult()
        : state(GatewayState::RECEIVED)
        , status(CompletionStatus::NONE)
        , has_result(false)
        , timeout_s(0)
    {
        states.push_back(GatewayState::RECEIVED);
    }

    void enter(GatewayState next) {
        state = next;
        states.push_back(next);
    }

    static GatewayResult rejected(const GatewayError& err) {
        GatewayResult r;
        r.enter(GatewayState::REJECTED);
        r.error = err;
        return r;
    }

    bool ok() const { return !error.is_error(); }
    bool is_rejected() const { return state == GatewayState::REJECTED; }
    bool timed_out() const { return status == CompletionStatus::TIMED_OUT; }

    // Structured form for tool responses and the CLI
    Json to_json() const;
};

class Gateway {
public:
    // A NULL runner selects PosixProcessRunner. A NULL audit recorder
    // disables the audit trail.
    explicit Gateway(const Policy& policy,
                     std::shared_ptr<ProcessRunner> runner = std::shared_ptr<ProcessRunner>(),
                     std::shared_ptr<AuditRecorder> audit = std::shared_ptr<AuditRecorder>());

    GatewayResult execute(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::optional<std::string>& working_dir = std::nullopt,
                          const std::optional<int64_t>& timeout_seconds = std::nullopt);

    GatewayResult execute(const CommandRequest& request);

    // Snapshot of the current policy; stays valid across set_policy()
    std::shared_ptr<const Policy> policy() const;

    // Replace the whole policy. Requests already running keep the snapshot
    // they started with.
    void set_policy(const Policy& policy);

    AuditRecorder* audit() const { return audit_.get(); }

private:
    GatewayResult reject(GatewayResult gr, const RequestSummary& summary,
                         ErrorKind kind, const std::string& reason);

    std::shared_ptr<const Policy> policy_;
    mutable std::mutex policy_mutex_;
    std::shared_ptr<ProcessRunner> runner_;
    std::shared_ptr<AuditRecorder> audit_;
};

} // namespace execgate

#endif // execgate_CORE_GATEWAY_HPP
