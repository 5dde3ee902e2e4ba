/*
 * execgate C++17 - Audit Trail
 *
 * One JSON object per line, appended to a single file:
 *
 *   {"timestamp":"2026-10-18T09:12:44.120Z","timestamp_ms":1792314764120,
 *    "program":"python3","arg_count":2,
 *    "args_digest":"9f86d0...","outcome":"Accepted","exit_code":0,
 *    "elapsed_ms":41,"truncated":false,"error_kind":""}
 *
 * Argument values are never written; only their count and an HMAC-SHA256
 * of the length-prefixed list. The HMAC key is `audit.digest_key` when
 * configured, otherwise random per recorder, so digests are comparable only
 * between records made under the same key. Lines are self-contained, so a reader can
 * start at any line boundary. A torn or unparsable line is skipped.
 *
 * Recording is best effort. Write failures go to the operational log and
 * never reach the gateway caller.
 */
#ifndef execgate_CORE_AUDIT_HPP
#define execgate_CORE_AUDIT_HPP

#include <execgate/core/types.hpp>
#include <execgate/core/errors.hpp>
#include <execgate/core/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <cstdint>
#include <cstddef>

namespace execgate {

class Config;

enum class AuditOutcome {
    ACCEPTED,
    REJECTED,
    TIMED_OUT,
    FAILED
};

const char* audit_outcome_name(AuditOutcome outcome);

// Inverse of audit_outcome_name(). Returns false for unknown names.
bool parse_audit_outcome(const std::string& name, AuditOutcome& out);

// Digest of an argument list: HMAC-SHA256 under `key` over "<count>;"
// followed by "<len>:<bytes>" for each argument, so ["a b"] and ["a", "b"]
// differ. Empty when `key` is empty.
std::string digest_arguments(const std::vector<std::string>& args, const std::string& key);

// What the audit trail is allowed to know about a request
struct RequestSummary {
    std::string program;
    size_t arg_count;
    std::string args_digest;

    RequestSummary() : arg_count(0) {}

    static RequestSummary of(const CommandRequest& request, const std::string& digest_key);
};

struct AuditRecord {
    int64_t timestamp_ms;
    std::string program;
    size_t arg_count;
    std::string args_digest;
    AuditOutcome outcome;
    std::optional<int> exit_code;
    int64_t elapsed_ms;
    bool truncated;
    std::string error_kind;     // ErrorKind name for Rejected / Failed

    AuditRecord()
        : timestamp_ms(0)
        , arg_count(0)
        , outcome(AuditOutcome::REJECTED)
        , elapsed_ms(0)
        , truncated(false) {}

    Json to_json() const;

    // Strict: every field must be present with the right type
    static bool from_json(const Json& j, AuditRecord& out);
};

// ============================================================================
// Recorder
// ============================================================================

struct AuditConfig {
    bool enabled;
    std::string path;
    std::string digest_key;     // Empty: random key per recorder

    AuditConfig() : enabled(true), path("execgate-audit.log") {}

    static AuditConfig from_config(const Config& cfg);
};

class AuditRecorder {
public:
    // An empty digest key is replaced by 32 random bytes
    explicit AuditRecorder(const std::string& path, const std::string& digest_key = "");
    ~AuditRecorder();

    // Summary with the argument digest keyed for this log
    RequestSummary summarize(const CommandRequest& request) const;

    // Never throws, never reports failure to the caller.
    // `result` is NULL when no process ran.
    void record(const RequestSummary& summary,
                AuditOutcome outcome,
                const ExecutionResult* result,
                ErrorKind kind = ErrorKind::NONE);

    const std::string& path() const { return path_; }

    // Writes that could not be persisted since construction
    size_t failed_writes() const;

private:
    AuditRecorder(const AuditRecorder&);
    AuditRecorder& operator=(const AuditRecorder&);

    // Caller holds mutex_
    bool ensure_open();
    bool write_line(const std::string& line);

    std::string path_;
    std::string digest_key_;
    int fd_;
    size_t failed_writes_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Reader
// ============================================================================

struct AuditLogContents {
    std::vector<AuditRecord> records;
    size_t corrupt_lines;       // Unparsable lines plus a torn final line

    AuditLogContents() : corrupt_lines(0) {}
};

class AuditLogReader {
public:
    // False only if the file cannot be opened; damaged content is skipped.
    static bool read_file(const std::string& path, AuditLogContents& out, std::string& error);

    static AuditLogContents read_string(const std::string& content);
};

} // namespace execgate

#endif // execgate_CORE_AUDIT_HPP
