/*
 * execgate C++17 - Working-Directory Resolver
 */
#ifndef execgate_CORE_WORKDIR_HPP
#define execgate_CORE_WORKDIR_HPP

#include <execgate/core/errors.hpp>
#include <execgate/core/policy.hpp>
#include <string>
#include <optional>

namespace execgate {

struct WorkdirResolution {
    bool success;
    std::string path;       // Canonical directory on success
    ErrorKind kind;         // OUTSIDE_ALLOWED_ROOTS / WORKING_DIR_NOT_FOUND on failure
    std::string reason;

    WorkdirResolution() : success(false), kind(ErrorKind::NONE) {}

    static WorkdirResolution ok(const std::string& p) {
        WorkdirResolution r;
        r.success = true;
        r.path = p;
        return r;
    }

    static WorkdirResolution fail(ErrorKind k, const std::string& why) {
        WorkdirResolution r;
        r.kind = k;
        r.reason = why;
        return r;
    }
};

class WorkdirResolver {
public:
    // Absent path -> policy default (default_working_dir, else the process
    // working directory). A given path must exist, canonicalize (symlinks
    // resolved) to a directory, sit at or below an allowed root and not at
    // or below a denied root.
    static WorkdirResolution resolve(const std::optional<std::string>& path, const Policy& policy);
};

} // namespace execgate

#endif // execgate_CORE_WORKDIR_HPP
