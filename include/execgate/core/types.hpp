/*
 * execgate C++17 - Request / Result Types
 */
#ifndef execgate_CORE_TYPES_HPP
#define execgate_CORE_TYPES_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace execgate {

// ============================================================================
// Command Request
// ============================================================================

struct CommandRequest {
    std::string program;                      // Exact whitelist name, never a command line
    std::vector<std::string> args;            // Argument vector, passed through unchanged
    std::optional<std::string> working_dir;   // Absent = policy default
    std::optional<int64_t> timeout_seconds;   // Absent = policy default

    CommandRequest() {}
    CommandRequest(const std::string& p, const std::vector<std::string>& a)
        : program(p), args(a) {}

    bool operator==(const CommandRequest& other) const {
        return program == other.program && args == other.args &&
               working_dir == other.working_dir &&
               timeout_seconds == other.timeout_seconds;
    }
    bool operator!=(const CommandRequest& other) const { return !(*this == other); }
};

// ============================================================================
// Execution Result
// ============================================================================

struct ExecutionResult {
    std::optional<int> exit_code;   // Absent when timed out or killed by a signal
    int term_signal;                // Signal that ended the child (0 = none)
    std::string stdout_output;      // Capped, verbatim
    std::string stderr_output;      // Capped, verbatim
    bool truncated;                 // Combined output hit max_output_bytes
    int64_t elapsed_ms;             // Wall clock from spawn to reap
    bool timed_out;                 // Watchdog killed the process group

    ExecutionResult() : term_signal(0), truncated(false), elapsed_ms(0), timed_out(false) {}

    bool exited_cleanly() const { return !timed_out && exit_code && *exit_code == 0; }
};

} // namespace execgate

#endif // execgate_CORE_TYPES_HPP
