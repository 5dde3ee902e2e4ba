/*
 * execgate C++17 - Working-Directory Resolver Implementation
 */
#include <execgate/core/workdir.hpp>
#include <execgate/core/logger.hpp>
#include <execgate/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace execgate {

namespace {

bool within_any(const std::string& path, const std::set<std::string>& roots) {
    for (std::set<std::string>::const_iterator it = roots.begin(); it != roots.end(); ++it) {
        if (path_within(path, *it)) return true;
    }
    return false;
}

WorkdirResolution resolve_default(const Policy& policy) {
    std::string dir = policy.default_working_dir.empty()
        ? current_directory()
        : policy.default_working_dir;

    std::string canon = canonical_path(dir);
    if (canon.empty()) {
        return WorkdirResolution::fail(ErrorKind::WORKING_DIR_NOT_FOUND,
                                       "Default working directory does not exist: " + dir);
    }
    return WorkdirResolution::ok(canon);
}

} // anonymous namespace

WorkdirResolution WorkdirResolver::resolve(const std::optional<std::string>& path, const Policy& policy) {
    if (!path || path->empty()) {
        return resolve_default(policy);
    }

    const std::string& requested = *path;

    // Existence first: a missing path is reported as such, never guessed at
    struct stat st;
    if (stat(requested.c_str(), &st) != 0) {
        return WorkdirResolution::fail(ErrorKind::WORKING_DIR_NOT_FOUND,
                                       "Working directory does not exist: " + requested);
    }

    std::string canon = canonical_path(requested);
    if (canon.empty()) {
        int err = errno;
        return WorkdirResolution::fail(ErrorKind::WORKING_DIR_NOT_FOUND,
                                       "Cannot resolve working directory: " + requested +
                                       " (" + strerror(err) + ")");
    }

    if (stat(canon.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        return WorkdirResolution::fail(ErrorKind::WORKING_DIR_NOT_FOUND,
                                       "Not a directory: " + requested);
    }

    if (!within_any(canon, policy.allowed_working_dirs)) {
        LOG_WARN("Working directory '%s' resolves to '%s', outside allowed roots",
                 requested.c_str(), canon.c_str());
        return WorkdirResolution::fail(ErrorKind::OUTSIDE_ALLOWED_ROOTS,
                                       "Working directory outside allowed roots: " + requested);
    }

    if (within_any(canon, policy.denied_working_dirs)) {
        LOG_WARN("Working directory '%s' resolves to '%s', inside a denied root",
                 requested.c_str(), canon.c_str());
        return WorkdirResolution::fail(ErrorKind::OUTSIDE_ALLOWED_ROOTS,
                                       "Unsafe working directory: " + requested);
    }

    return WorkdirResolution::ok(canon);
}

} // namespace execgate
