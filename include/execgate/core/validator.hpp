/*
 * execgate C++17 - Command Validator
 *
 * Pure check of a (sanitized) CommandRequest against a Policy. Checks run in
 * a fixed order and stop at the first failure, so the reported kind is
 * deterministic:
 *
 *   1. whitelist           NotWhitelisted
 *   2. argument count      TooManyArguments
 *   3. argument length     ArgumentTooLong
 *   4. shell metachars     DangerousCharacter
 *   5. denylist patterns   DangerousPattern
 *   6. ".." components     PathTraversal
 *
 * The pattern denylist is a heuristic. It has false positives and can be
 * bypassed by obfuscation; the actual injection barrier is that the runner
 * never goes through a shell.
 */
#ifndef execgate_CORE_VALIDATOR_HPP
#define execgate_CORE_VALIDATOR_HPP

#include <execgate/core/types.hpp>
#include <execgate/core/errors.hpp>
#include <execgate/core/policy.hpp>
#include <string>
#include <vector>

namespace execgate {

struct ValidationOutcome {
    bool accepted;
    ErrorKind kind;             // NONE when accepted
    std::string reason;         // Human readable, never echoes argument values
    CommandRequest request;     // The accepted request

    ValidationOutcome() : accepted(false), kind(ErrorKind::NONE) {}

    static ValidationOutcome accept(const CommandRequest& req) {
        ValidationOutcome o;
        o.accepted = true;
        o.request = req;
        return o;
    }

    static ValidationOutcome reject(ErrorKind k, const std::string& why) {
        ValidationOutcome o;
        o.accepted = false;
        o.kind = k;
        o.reason = why;
        return o;
    }

    bool operator==(const ValidationOutcome& other) const {
        return accepted == other.accepted && kind == other.kind &&
               reason == other.reason && request == other.request;
    }
};

class CommandValidator {
public:
    static ValidationOutcome validate(const CommandRequest& request, const Policy& policy);

    // Shell metacharacters refused in any argument
    static const std::string& dangerous_characters();

    // Label of the first case-sensitive denylist rule the argument matches,
    // empty if none. Any run of whitespace inside a rule matches.
    static std::string match_dangerous_pattern(const std::string& arg);

    // True if any '/', '\\', '=' or ':' separated component equals ".."
    static bool has_parent_component(const std::string& arg);
};

} // namespace execgate

#endif // execgate_CORE_VALIDATOR_HPP
