/*
 * execgate C++17 - Execution Policy
 *
 * Immutable once handed to a Gateway. Reconfiguration builds a new Policy
 * and swaps the whole object (Gateway::set_policy), never edits fields
 * of a live one.
 */
#ifndef execgate_CORE_POLICY_HPP
#define execgate_CORE_POLICY_HPP

#include <set>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace execgate {

class Config;

struct Policy {
    static const size_t DEFAULT_MAX_ARG_LEN = 4096;
    static const size_t DEFAULT_MAX_ARG_COUNT = 50;
    static const int64_t DEFAULT_TIMEOUT_S = 30;
    static const int64_t DEFAULT_MAX_TIMEOUT_S = 300;
    static const size_t DEFAULT_MAX_OUTPUT_BYTES = 10 * 1024 * 1024;

    std::set<std::string> whitelist;              // Allowed program names (exact, case-sensitive)
    size_t max_arg_len;                           // Bytes per argument
    size_t max_arg_count;                         // Arguments per request
    int64_t default_timeout_s;                    // Used when the request has no timeout
    int64_t max_timeout_s;                        // Upper clamp for requested timeouts
    size_t max_output_bytes;                      // Combined stdout + stderr capture
    std::set<std::string> allowed_working_dirs;   // Canonical roots
    std::set<std::string> denied_working_dirs;    // Refused even inside an allowed root
    std::string default_working_dir;              // Empty = process working directory
    bool redact_output_secrets;                   // Mask credential-looking output

    Policy();

    // Build from the "policy.*" section of a config. Missing keys keep
    // their defaults. Root directories are canonicalized.
    static Policy from_config(const Config& cfg);

    // Canonicalize allowed/denied roots in place. Roots that do not exist
    // are kept as given and logged.
    void canonicalize_roots();

    // min(max(requested, 1), max_timeout_s), or default_timeout_s if absent
    int64_t effective_timeout(const std::optional<int64_t>& requested) const;

    bool is_whitelisted(const std::string& program) const {
        return whitelist.find(program) != whitelist.end();
    }
};

} // namespace execgate

#endif // execgate_CORE_POLICY_HPP
