/*
 * execgate C++17 - Execution Gateway Implementation
 */
#include <execgate/core/gateway.hpp>
#include <execgate/core/sanitizer.hpp>
#include <execgate/core/validator.hpp>
#include <execgate/core/workdir.hpp>
#include <execgate/core/redactor.hpp>
#include <execgate/core/logger.hpp>

namespace execgate {

const char* gateway_state_name(GatewayState state) {
    switch (state) {
        case GatewayState::RECEIVED: return "Received";
        case GatewayState::SANITIZED: return "Sanitized";
        case GatewayState::VALIDATED: return "Validated";
        case GatewayState::REJECTED: return "Rejected";
        case GatewayState::WORKDIR_RESOLVED: return "WorkingDirResolved";
        case GatewayState::EXECUTING: return "Executing";
        case GatewayState::COMPLETED: return "Completed";
        default: return "Unknown";
    }
}

const char* completion_status_name(CompletionStatus status) {
    switch (status) {
        case CompletionStatus::SUCCESS: return "Success";
        case CompletionStatus::TIMED_OUT: return "TimedOut";
        case CompletionStatus::FAILED: return "Failed";
        case CompletionStatus::NONE:
        default: return "";
    }
}

// ============================================================================
// GatewayResult
// ============================================================================

Json GatewayResult::to_json() const {
    Json j = Json::object();
    j["state"] = gateway_state_name(state);
    Json trail = Json::array();
    for (size_t i = 0; i < states.size(); ++i) {
        trail.push_back(gateway_state_name(states[i]));
    }
    j["states"] = trail;
    j["status"] = completion_status_name(status);

    if (error.is_error()) {
        Json e = Json::object();
        e["category"] = error_category_name(error.category);
        e["kind"] = error_kind_name(error.kind);
        e["message"] = error.message;
        j["error"] = e;
    } else {
        j["error"] = nullptr;
    }

    if (has_result) {
        Json r = Json::object();
        if (result.exit_code) {
            r["exit_code"] = *result.exit_code;
        } else {
            r["exit_code"] = nullptr;
        }
        r["signal"] = result.term_signal;
        r["stdout"] = result.stdout_output;
        r["stderr"] = result.stderr_output;
        r["truncated"] = result.truncated;
        r["timed_out"] = result.timed_out;
        r["elapsed_ms"] = result.elapsed_ms;
        j["result"] = r;
    } else {
        j["result"] = nullptr;
    }

    if (!working_dir.empty()) j["working_dir"] = working_dir;
    if (timeout_s > 0) j["timeout_s"] = timeout_s;
    return j;
}

// ============================================================================
// Gateway
// ============================================================================

Gateway::Gateway(const Policy& policy,
                 std::shared_ptr<ProcessRunner> runner,
                 std::shared_ptr<AuditRecorder> audit)
    : policy_(std::make_shared<const Policy>(policy))
    , runner_(runner)
    , audit_(audit)
{
    if (!runner_) {
        runner_ = std::make_shared<PosixProcessRunner>();
    }
    LOG_DEBUG("Gateway ready: %zu whitelisted programs, audit %s",
              policy.whitelist.size(), audit_ ? audit_->path().c_str() : "disabled");
}

std::shared_ptr<const Policy> Gateway::policy() const {
    std::lock_guard<std::mutex> lock(policy_mutex_);
    return policy_;
}

void Gateway::set_policy(const Policy& policy) {
    std::shared_ptr<const Policy> next = std::make_shared<const Policy>(policy);
    std::lock_guard<std::mutex> lock(policy_mutex_);
    policy_ = next;
    LOG_INFO("Gateway policy replaced (%zu whitelisted programs)", policy.whitelist.size());
}

GatewayResult Gateway::reject(GatewayResult gr, const RequestSummary& summary,
                              ErrorKind kind, const std::string& reason) {
    // Only the kind is logged; arguments may carry secrets
    LOG_WARN("Rejected '%s' (%zu args): %s", summary.program.c_str(), summary.arg_count,
             error_kind_name(kind));
    if (audit_) {
        audit_->record(summary, AuditOutcome::REJECTED, NULL, kind);
    }
    gr.enter(GatewayState::REJECTED);
    gr.error = GatewayError(kind, reason);
    return gr;
}

GatewayResult Gateway::execute(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::optional<std::string>& working_dir,
                               const std::optional<int64_t>& timeout_seconds) {
    CommandRequest request(program, args);
    request.working_dir = working_dir;
    request.timeout_seconds = timeout_seconds;
    return execute(request);
}

GatewayResult Gateway::execute(const CommandRequest& received) {
    // One snapshot for the whole request
    std::shared_ptr<const Policy> snapshot = policy();

    GatewayResult gr;

    // Received -> Sanitized
    const CommandRequest sanitized = sanitize_request(received);
    const RequestSummary summary = audit_ ? audit_->summarize(sanitized)
                                          : RequestSummary::of(sanitized, std::string());
    gr.enter(GatewayState::SANITIZED);

    // Sanitized -> Validated | Rejected
    ValidationOutcome outcome = CommandValidator::validate(sanitized, *snapshot);
    if (!outcome.accepted) {
        return reject(gr, summary, outcome.kind, outcome.reason);
    }
    const CommandRequest& request = outcome.request;
    gr.enter(GatewayState::VALIDATED);

    // Validated -> WorkingDirResolved | Rejected
    WorkdirResolution workdir = WorkdirResolver::resolve(request.working_dir, *snapshot);
    if (!workdir.success) {
        return reject(gr, summary, workdir.kind, workdir.reason);
    }
    gr.working_dir = workdir.path;
    gr.timeout_s = snapshot->effective_timeout(request.timeout_seconds);
    gr.enter(GatewayState::WORKDIR_RESOLVED);

    // WorkingDirResolved -> Executing
    gr.enter(GatewayState::EXECUTING);
    LOG_INFO("Executing command: %s with %zu args in %s (timeout %llds)",
             request.program.c_str(), request.args.size(), workdir.path.c_str(),
             static_cast<long long>(gr.timeout_s));

    RunOutcome run = runner_->run(request.program, request.args, workdir.path,
                                  request.timeout_seconds, *snapshot);

    gr.enter(GatewayState::COMPLETED);

    if (!run.success) {
        gr.status = CompletionStatus::FAILED;
        gr.error = GatewayError(run.kind, run.error);
        LOG_ERROR("Command execution failed: %s", run.error.c_str());
        if (audit_) {
            audit_->record(summary, AuditOutcome::FAILED, NULL, run.kind);
        }
        return gr;
    }

    gr.has_result = true;
    gr.result = run.result;

    if (snapshot->redact_output_secrets) {
        gr.result.stdout_output = redact_secrets(gr.result.stdout_output);
        gr.result.stderr_output = redact_secrets(gr.result.stderr_output);
    }

    AuditOutcome audit_outcome;
    if (gr.result.timed_out) {
        gr.status = CompletionStatus::TIMED_OUT;
        audit_outcome = AuditOutcome::TIMED_OUT;
        LOG_WARN("Command timed out after %llds", static_cast<long long>(gr.timeout_s));
    } else if (gr.result.exit_code && *gr.result.exit_code == 0) {
        gr.status = CompletionStatus::SUCCESS;
        audit_outcome = AuditOutcome::ACCEPTED;
        LOG_INFO("Command completed successfully in %lldms",
                 static_cast<long long>(gr.result.elapsed_ms));
    } else {
        gr.status = CompletionStatus::FAILED;
        audit_outcome = AuditOutcome::FAILED;
        if (gr.result.exit_code) {
            LOG_WARN("Command failed with code %d in %lldms", *gr.result.exit_code,
                     static_cast<long long>(gr.result.elapsed_ms));
        } else {
            LOG_WARN("Command killed by signal %d after %lldms", gr.result.term_signal,
                     static_cast<long long>(gr.result.elapsed_ms));
        }
    }

    if (audit_) {
        audit_->record(summary, audit_outcome, &gr.result);
    }
    return gr;
}

} // namespace execgate
