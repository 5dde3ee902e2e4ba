/*
 * execgate C++17 - Error Taxonomy
 *
 *   ValidationError - the request itself is unacceptable (bad program/args)
 *   SecurityError   - the request reaches outside its allowed resources
 *   ExecutionError  - the OS refused to start the process
 *
 * Timeouts are not errors; see ExecutionResult::timed_out.
 */
#ifndef execgate_CORE_ERRORS_HPP
#define execgate_CORE_ERRORS_HPP

#include <string>

namespace execgate {

enum class ErrorCategory {
    NONE = 0,
    VALIDATION,
    SECURITY,
    EXECUTION
};

enum class ErrorKind {
    NONE = 0,

    // ValidationError
    NOT_WHITELISTED,
    TOO_MANY_ARGUMENTS,
    ARGUMENT_TOO_LONG,
    DANGEROUS_CHARACTER,
    DANGEROUS_PATTERN,
    PATH_TRAVERSAL,

    // SecurityError
    OUTSIDE_ALLOWED_ROOTS,
    WORKING_DIR_NOT_FOUND,

    // ExecutionError
    SPAWN_FAILED,
    PERMISSION_DENIED
};

ErrorCategory category_of(ErrorKind kind);

// Stable names used in logs, audit records and JSON output
const char* error_kind_name(ErrorKind kind);          // e.g. "NotWhitelisted"
const char* error_category_name(ErrorCategory cat);   // e.g. "ValidationError"

// Structured failure handed back to callers
struct GatewayError {
    ErrorCategory category;
    ErrorKind kind;
    std::string message;

    GatewayError() : category(ErrorCategory::NONE), kind(ErrorKind::NONE) {}
    GatewayError(ErrorKind k, const std::string& msg)
        : category(category_of(k)), kind(k), message(msg) {}

    bool is_error() const { return kind != ErrorKind::NONE; }

    // "ValidationError{NotWhitelisted}: Command not allowed: rm"
    std::string to_string() const;
};

} // namespace execgate

#endif // execgate_CORE_ERRORS_HPP
