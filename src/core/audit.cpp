/*
 * execgate C++17 - Audit Trail Implementation
 */
#include <execgate/core/audit.hpp>
#include <execgate/core/config.hpp>
#include <execgate/core/logger.hpp>
#include <execgate/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

namespace execgate {

// ============================================================================
// Names and digests
// ============================================================================

const char* audit_outcome_name(AuditOutcome outcome) {
    switch (outcome) {
        case AuditOutcome::ACCEPTED: return "Accepted";
        case AuditOutcome::REJECTED: return "Rejected";
        case AuditOutcome::TIMED_OUT: return "TimedOut";
        case AuditOutcome::FAILED: return "Failed";
        default: return "Unknown";
    }
}

bool parse_audit_outcome(const std::string& name, AuditOutcome& out) {
    if (name == "Accepted") { out = AuditOutcome::ACCEPTED; return true; }
    if (name == "Rejected") { out = AuditOutcome::REJECTED; return true; }
    if (name == "TimedOut") { out = AuditOutcome::TIMED_OUT; return true; }
    if (name == "Failed") { out = AuditOutcome::FAILED; return true; }
    return false;
}

std::string digest_arguments(const std::vector<std::string>& args, const std::string& key) {
    std::string material = std::to_string(args.size()) + ";";
    for (size_t i = 0; i < args.size(); ++i) {
        material += std::to_string(args[i].size());
        material += ':';
        material += args[i];
    }
    return hmac_sha256_hex(key, material);
}

RequestSummary RequestSummary::of(const CommandRequest& request, const std::string& digest_key) {
    RequestSummary s;
    s.program = request.program;
    s.arg_count = request.args.size();
    s.args_digest = digest_arguments(request.args, digest_key);
    return s;
}

// ============================================================================
// AuditRecord
// ============================================================================

Json AuditRecord::to_json() const {
    Json j = Json::object();
    j["timestamp"] = format_timestamp_ms(timestamp_ms);
    j["timestamp_ms"] = timestamp_ms;
    j["program"] = program;
    j["arg_count"] = arg_count;
    j["args_digest"] = args_digest;
    j["outcome"] = audit_outcome_name(outcome);
    if (exit_code) {
        j["exit_code"] = *exit_code;
    } else {
        j["exit_code"] = nullptr;
    }
    j["elapsed_ms"] = elapsed_ms;
    j["truncated"] = truncated;
    j["error_kind"] = error_kind;
    return j;
}

bool AuditRecord::from_json(const Json& j, AuditRecord& out) {
    if (!j.is_object()) return false;

    static const char* const required[] = {
        "timestamp_ms", "program", "arg_count", "args_digest", "outcome",
        "exit_code", "elapsed_ms", "truncated", "error_kind", NULL
    };
    for (int i = 0; required[i] != NULL; ++i) {
        if (!j.contains(required[i])) return false;
    }

    if (!j["timestamp_ms"].is_number_integer() ||
        !j["program"].is_string() ||
        !j["arg_count"].is_number_unsigned() ||
        !j["args_digest"].is_string() ||
        !j["outcome"].is_string() ||
        !(j["exit_code"].is_null() || j["exit_code"].is_number_integer()) ||
        !j["elapsed_ms"].is_number_integer() ||
        !j["truncated"].is_boolean() ||
        !j["error_kind"].is_string()) {
        return false;
    }

    AuditRecord r;
    if (!parse_audit_outcome(j["outcome"].get<std::string>(), r.outcome)) {
        return false;
    }
    r.timestamp_ms = j["timestamp_ms"].get<int64_t>();
    r.program = j["program"].get<std::string>();
    r.arg_count = j["arg_count"].get<size_t>();
    r.args_digest = j["args_digest"].get<std::string>();
    if (!j["exit_code"].is_null()) {
        r.exit_code = j["exit_code"].get<int>();
    }
    r.elapsed_ms = j["elapsed_ms"].get<int64_t>();
    r.truncated = j["truncated"].get<bool>();
    r.error_kind = j["error_kind"].get<std::string>();

    out = r;
    return true;
}

// ============================================================================
// AuditConfig
// ============================================================================

AuditConfig AuditConfig::from_config(const Config& cfg) {
    AuditConfig c;
    c.enabled = cfg.get_bool("audit.enabled", true);
    c.path = cfg.get_string("audit.path", c.path);
    c.digest_key = cfg.get_string("audit.digest_key", "");
    return c;
}

// ============================================================================
// AuditRecorder
// ============================================================================

AuditRecorder::AuditRecorder(const std::string& path, const std::string& digest_key)
    : path_(path)
    , digest_key_(digest_key)
    , fd_(-1)
    , failed_writes_(0)
{
    if (digest_key_.empty()) {
        if (random_bytes(32, digest_key_)) {
            LOG_DEBUG("Audit digest key generated for %s", path_.c_str());
        } else {
            LOG_ERROR("Cannot generate audit digest key, argument digests disabled");
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (ensure_open()) {
        LOG_INFO("Audit log: %s", path_.c_str());
    }
}

AuditRecorder::~AuditRecorder() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

RequestSummary AuditRecorder::summarize(const CommandRequest& request) const {
    return RequestSummary::of(request, digest_key_);
}

bool AuditRecorder::ensure_open() {
    if (fd_ >= 0) return true;

    fd_ = open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        LOG_ERROR("Cannot open audit log %s: %s", path_.c_str(), strerror(errno));
        return false;
    }
    return true;
}

bool AuditRecorder::write_line(const std::string& line) {
    if (!ensure_open()) return false;

    // O_APPEND + one write per record keeps lines whole even if another
    // process appends to the same file
    const char* data = line.data();
    size_t left = line.size();
    while (left > 0) {
        ssize_t n = write(fd_, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("Audit write to %s failed: %s", path_.c_str(), strerror(errno));
            close(fd_);
            fd_ = -1;
            return false;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

void AuditRecorder::record(const RequestSummary& summary,
                           AuditOutcome outcome,
                           const ExecutionResult* result,
                           ErrorKind kind) {
    AuditRecord rec;
    rec.timestamp_ms = current_timestamp_ms();
    rec.program = summary.program;
    rec.arg_count = summary.arg_count;
    rec.args_digest = summary.args_digest;
    rec.outcome = outcome;
    rec.error_kind = error_kind_name(kind);
    if (result) {
        rec.exit_code = result->exit_code;
        rec.elapsed_ms = result->elapsed_ms;
        rec.truncated = result->truncated;
    }

    std::string line;
    try {
        // Replace invalid UTF-8 in the program name instead of throwing
        line = rec.to_json().dump(-1, ' ', false, Json::error_handler_t::replace);
    } catch (const std::exception& e) {
        LOG_ERROR("Audit record serialization failed: %s", e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        ++failed_writes_;
        return;
    }
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (!write_line(line)) {
        ++failed_writes_;
        LOG_WARN("Audit record for '%s' (%s) dropped", summary.program.c_str(),
                 audit_outcome_name(outcome));
    }
}

size_t AuditRecorder::failed_writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_writes_;
}

// ============================================================================
// AuditLogReader
// ============================================================================

AuditLogContents AuditLogReader::read_string(const std::string& content) {
    AuditLogContents out;

    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            // Torn final line (crash mid-write)
            ++out.corrupt_lines;
            break;
        }

        std::string line = content.substr(start, nl - start);
        start = nl + 1;

        if (trim(line).empty()) continue;

        Json j = Json::parse(line, nullptr, false);
        AuditRecord rec;
        if (j.is_discarded() || !AuditRecord::from_json(j, rec)) {
            ++out.corrupt_lines;
            continue;
        }
        out.records.push_back(rec);
    }

    if (out.corrupt_lines > 0) {
        LOG_WARN("Audit log: skipped %zu corrupt line(s)", out.corrupt_lines);
    }
    return out;
}

bool AuditLogReader::read_file(const std::string& path, AuditLogContents& out, std::string& error) {
    std::ifstream file(path.c_str(), std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        error = "Cannot open audit log: " + path;
        return false;
    }

    std::ostringstream buf;
    buf << file.rdbuf();
    out = read_string(buf.str());
    return true;
}

} // namespace execgate
