#include <execgate/core/errors.hpp>

namespace execgate {

ErrorCategory category_of(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_WHITELISTED:
        case ErrorKind::TOO_MANY_ARGUMENTS:
        case ErrorKind::ARGUMENT_TOO_LONG:
        case ErrorKind::DANGEROUS_CHARACTER:
        case ErrorKind::DANGEROUS_PATTERN:
        case ErrorKind::PATH_TRAVERSAL:
            return ErrorCategory::VALIDATION;
        case ErrorKind::OUTSIDE_ALLOWED_ROOTS:
        case ErrorKind::WORKING_DIR_NOT_FOUND:
            return ErrorCategory::SECURITY;
        case ErrorKind::SPAWN_FAILED:
        case ErrorKind::PERMISSION_DENIED:
            return ErrorCategory::EXECUTION;
        case ErrorKind::NONE:
        default:
            return ErrorCategory::NONE;
    }
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_WHITELISTED: return "NotWhitelisted";
        case ErrorKind::TOO_MANY_ARGUMENTS: return "TooManyArguments";
        case ErrorKind::ARGUMENT_TOO_LONG: return "ArgumentTooLong";
        case ErrorKind::DANGEROUS_CHARACTER: return "DangerousCharacter";
        case ErrorKind::DANGEROUS_PATTERN: return "DangerousPattern";
        case ErrorKind::PATH_TRAVERSAL: return "PathTraversal";
        case ErrorKind::OUTSIDE_ALLOWED_ROOTS: return "OutsideAllowedRoots";
        case ErrorKind::WORKING_DIR_NOT_FOUND: return "WorkingDirNotFound";
        case ErrorKind::SPAWN_FAILED: return "SpawnFailed";
        case ErrorKind::PERMISSION_DENIED: return "PermissionDenied";
        case ErrorKind::NONE:
        default: return "";
    }
}

const char* error_category_name(ErrorCategory cat) {
    switch (cat) {
        case ErrorCategory::VALIDATION: return "ValidationError";
        case ErrorCategory::SECURITY: return "SecurityError";
        case ErrorCategory::EXECUTION: return "ExecutionError";
        case ErrorCategory::NONE:
        default: return "";
    }
}

std::string GatewayError::to_string() const {
    if (!is_error()) return "";
    return std::string(error_category_name(category)) + "{" +
           error_kind_name(kind) + "}: " + message;
}

} // namespace execgate
