/*
 * execgate C++17 - Execution Policy Implementation
 */
#include <execgate/core/policy.hpp>
#include <execgate/core/config.hpp>
#include <execgate/core/logger.hpp>
#include <execgate/core/utils.hpp>

namespace execgate {

const size_t Policy::DEFAULT_MAX_ARG_LEN;
const size_t Policy::DEFAULT_MAX_ARG_COUNT;
const int64_t Policy::DEFAULT_TIMEOUT_S;
const int64_t Policy::DEFAULT_MAX_TIMEOUT_S;
const size_t Policy::DEFAULT_MAX_OUTPUT_BYTES;

Policy::Policy()
    : max_arg_len(DEFAULT_MAX_ARG_LEN)
    , max_arg_count(DEFAULT_MAX_ARG_COUNT)
    , default_timeout_s(DEFAULT_TIMEOUT_S)
    , max_timeout_s(DEFAULT_MAX_TIMEOUT_S)
    , max_output_bytes(DEFAULT_MAX_OUTPUT_BYTES)
    , redact_output_secrets(false)
{
    denied_working_dirs.insert("/etc");
    denied_working_dirs.insert("/sys");
    denied_working_dirs.insert("/proc");
}

static size_t positive_size(const Config& cfg, const std::string& key, size_t def) {
    int64_t v = cfg.get_int(key, static_cast<int64_t>(def));
    if (v <= 0) {
        LOG_WARN("Policy: %s must be positive (got %lld), using %zu",
                 key.c_str(), static_cast<long long>(v), def);
        return def;
    }
    return static_cast<size_t>(v);
}

Policy Policy::from_config(const Config& cfg) {
    Policy p;

    std::vector<std::string> programs = cfg.get_string_list("policy.whitelist");
    p.whitelist.insert(programs.begin(), programs.end());

    p.max_arg_len = positive_size(cfg, "policy.max_arg_len", DEFAULT_MAX_ARG_LEN);
    p.max_arg_count = positive_size(cfg, "policy.max_arg_count", DEFAULT_MAX_ARG_COUNT);
    p.max_output_bytes = positive_size(cfg, "policy.max_output_bytes", DEFAULT_MAX_OUTPUT_BYTES);
    p.max_timeout_s = static_cast<int64_t>(
        positive_size(cfg, "policy.max_timeout_s", static_cast<size_t>(DEFAULT_MAX_TIMEOUT_S)));
    p.default_timeout_s = static_cast<int64_t>(
        positive_size(cfg, "policy.default_timeout_s", static_cast<size_t>(DEFAULT_TIMEOUT_S)));
    if (p.default_timeout_s > p.max_timeout_s) {
        LOG_WARN("Policy: default_timeout_s (%lld) exceeds max_timeout_s (%lld), clamping",
                 static_cast<long long>(p.default_timeout_s),
                 static_cast<long long>(p.max_timeout_s));
        p.default_timeout_s = p.max_timeout_s;
    }

    std::vector<std::string> allowed = cfg.get_string_list("policy.allowed_working_dirs");
    p.allowed_working_dirs.insert(allowed.begin(), allowed.end());

    if (cfg.has("policy.denied_working_dirs")) {
        std::vector<std::string> denied = cfg.get_string_list("policy.denied_working_dirs");
        p.denied_working_dirs.clear();
        p.denied_working_dirs.insert(denied.begin(), denied.end());
    }

    p.default_working_dir = cfg.get_string("policy.default_working_dir", "");
    p.redact_output_secrets = cfg.get_bool("policy.redact_output_secrets", false);

    p.canonicalize_roots();

    LOG_INFO("Policy loaded: %zu whitelisted programs, %zu allowed roots, "
             "timeout=%llds (max %llds), output cap=%zu bytes",
             p.whitelist.size(), p.allowed_working_dirs.size(),
             static_cast<long long>(p.default_timeout_s),
             static_cast<long long>(p.max_timeout_s), p.max_output_bytes);
    return p;
}

static std::set<std::string> canonical_set(const std::set<std::string>& roots, const char* what) {
    std::set<std::string> out;
    for (std::set<std::string>::const_iterator it = roots.begin(); it != roots.end(); ++it) {
        std::string canon = canonical_path(*it);
        if (canon.empty()) {
            LOG_WARN("Policy: %s root '%s' cannot be resolved, kept as given", what, it->c_str());
            out.insert(*it);
        } else {
            out.insert(canon);
        }
    }
    return out;
}

void Policy::canonicalize_roots() {
    allowed_working_dirs = canonical_set(allowed_working_dirs, "allowed");
    denied_working_dirs = canonical_set(denied_working_dirs, "denied");
}

int64_t Policy::effective_timeout(const std::optional<int64_t>& requested) const {
    if (!requested) return default_timeout_s;
    return clamp<int64_t>(*requested, 1, max_timeout_s);
}

} // namespace execgate
