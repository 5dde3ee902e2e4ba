/*
 * execgate C++17 - Command Validator Implementation
 */
#include <execgate/core/validator.hpp>
#include <execgate/core/utils.hpp>
#include <execgate/core/logger.hpp>

#include <cctype>
#include <regex>
#include <sstream>

namespace execgate {

namespace {

std::string describe_char(char c) {
    switch (c) {
        case '\n': return "'\\n'";
        case '\r': return "'\\r'";
        default: return std::string("'") + c + "'";
    }
}

struct DangerousPattern {
    const char* label;
    std::regex rule;

    DangerousPattern(const char* l, const char* pattern)
        : label(l), rule(pattern, std::regex::ECMAScript | std::regex::optimize) {}
};

// Case-sensitive, compiled once
const std::vector<DangerousPattern>& dangerous_pattern_rules() {
    static const std::vector<DangerousPattern> rules = {
        // Destructive deletion
        DangerousPattern("rm -rf", R"(rm\s+-rf)"),
        DangerousPattern("rm -fr", R"(rm\s+-fr)"),
        DangerousPattern("rm -r -f", R"(rm\s+-r\s+-f)"),
        DangerousPattern("shutil.rmtree", R"(shutil\.rmtree)"),
        // Dynamic code evaluation
        DangerousPattern("eval(", R"(eval\s*\()"),
        DangerousPattern("exec(", R"(exec\s*\()"),
        DangerousPattern("__import__", R"(__import__)"),
        // Process spawning from inside an interpreter
        DangerousPattern("subprocess", R"(subprocess)"),
        DangerousPattern("os.system", R"(os\.system)"),
        DangerousPattern("os.popen", R"(os\.popen)"),
        DangerousPattern("os.exec", R"(os\.exec)"),
        DangerousPattern("os.spawn", R"(os\.spawn)"),
        DangerousPattern("pty.spawn", R"(pty\.spawn)"),
        DangerousPattern("child_process", R"(child_process)"),
        // Fork bomb
        DangerousPattern(":(){", R"(:\s*\(\s*\)\s*\{)"),
    };
    return rules;
}

// Every whitespace run becomes one space, so "\s+" never repeats more than
// once and the regex engine's recursion stays shallow on long arguments.
std::string collapse_whitespace(const std::string& arg) {
    std::string out;
    out.reserve(arg.size());
    bool in_space = false;
    for (size_t i = 0; i < arg.size(); ++i) {
        if (std::isspace(static_cast<unsigned char>(arg[i]))) {
            if (!in_space) out += ' ';
            in_space = true;
        } else {
            out += arg[i];
            in_space = false;
        }
    }
    return out;
}

} // anonymous namespace

const std::string& CommandValidator::dangerous_characters() {
    static const std::string chars = std::string(";|&$`\n\r");
    return chars;
}

std::string CommandValidator::match_dangerous_pattern(const std::string& arg) {
    const std::vector<DangerousPattern>& rules = dangerous_pattern_rules();
    const std::string text = collapse_whitespace(arg);
    for (size_t r = 0; r < rules.size(); ++r) {
        try {
            if (std::regex_search(text, rules[r].rule)) return rules[r].label;
        } catch (const std::regex_error& e) {
            // Fail closed: an argument the matcher cannot scan is refused
            LOG_WARN("Denylist rule '%s' could not scan argument: %s",
                     rules[r].label, e.what());
            return rules[r].label;
        }
    }
    return "";
}

bool CommandValidator::has_parent_component(const std::string& arg) {
    if (arg.find("..") == std::string::npos) return false;

    std::vector<std::string> parts = split_any(arg, "/\\=:");
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i] == "..") return true;
    }
    return false;
}

ValidationOutcome CommandValidator::validate(const CommandRequest& request, const Policy& policy) {
    // 1. Whitelist
    if (!policy.is_whitelisted(request.program)) {
        return ValidationOutcome::reject(ErrorKind::NOT_WHITELISTED,
                                         "Command not allowed: " + request.program);
    }

    // 2. Argument count
    if (request.args.size() > policy.max_arg_count) {
        std::ostringstream oss;
        oss << "Too many arguments: " << request.args.size()
            << " (max: " << policy.max_arg_count << ")";
        return ValidationOutcome::reject(ErrorKind::TOO_MANY_ARGUMENTS, oss.str());
    }

    // 3. Per-argument length (bytes)
    for (size_t i = 0; i < request.args.size(); ++i) {
        if (request.args[i].size() > policy.max_arg_len) {
            std::ostringstream oss;
            oss << "Argument " << i << " too long: " << request.args[i].size()
                << " bytes (max: " << policy.max_arg_len << ")";
            return ValidationOutcome::reject(ErrorKind::ARGUMENT_TOO_LONG, oss.str());
        }
    }

    // 4. Shell metacharacters
    const std::string& chars = dangerous_characters();
    for (size_t i = 0; i < request.args.size(); ++i) {
        size_t pos = request.args[i].find_first_of(chars);
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << "Dangerous character in argument " << i << ": "
                << describe_char(request.args[i][pos]);
            return ValidationOutcome::reject(ErrorKind::DANGEROUS_CHARACTER, oss.str());
        }
    }

    // 5. Denylist patterns
    for (size_t i = 0; i < request.args.size(); ++i) {
        std::string label = match_dangerous_pattern(request.args[i]);
        if (!label.empty()) {
            std::ostringstream oss;
            oss << "Dangerous pattern in argument " << i << ": " << label;
            return ValidationOutcome::reject(ErrorKind::DANGEROUS_PATTERN, oss.str());
        }
    }

    // 6. Parent-directory components
    for (size_t i = 0; i < request.args.size(); ++i) {
        if (has_parent_component(request.args[i])) {
            std::ostringstream oss;
            oss << "Potential path traversal in argument " << i;
            return ValidationOutcome::reject(ErrorKind::PATH_TRAVERSAL, oss.str());
        }
    }

    return ValidationOutcome::accept(request);
}

} // namespace execgate
