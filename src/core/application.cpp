/*
 * execgate C++17 - Application Implementation
 *
 * Command-line front end: one request per invocation.
 */
#include <execgate/core/application.hpp>
#include <execgate/core/logger.hpp>
#include <execgate/core/utils.hpp>

#include <iostream>
#include <map>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <sys/stat.h>

namespace execgate {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Secure external command gateway\n\n"
              << "Usage: " << prog << " [options] [--] PROGRAM [ARGS...]\n"
              << "       " << prog << " [options] --audit-summary FILE\n\n"
              << "Options:\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version\n"
              << "  --config FILE          Configuration file (default: config.json if present)\n"
              << "  --cwd DIR              Working directory for the command\n"
              << "  --timeout SECONDS      Timeout, clamped to policy.max_timeout_s\n"
              << "  --audit-summary FILE   Summarize an audit log and exit\n\n"
              << "Exit status:\n"
              << "  child exit code, 124 on timeout, 2 on rejection,\n"
              << "  126 if the program could not be started, 1 on usage errors\n\n"
              << "Example:\n"
              << "  " << prog << " --config config.json --cwd /srv/work -- ls -la\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

bool parse_seconds(const char* text, int64_t& out) {
    if (!text || !*text) return false;
    errno = 0;
    char* end = NULL;
    long long v = strtoll(text, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = static_cast<int64_t>(v);
    return true;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // anonymous namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : config_file_("config.json")
    , config_explicit_(false)
    , exit_code_(0)
{}

bool Application::parse_args(int argc, char* argv[]) {
    int i = 1;
    for (; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            exit_code_ = 0;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            exit_code_ = 0;
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            config_explicit_ = true;
            continue;
        }
        if (strcmp(argv[i], "--cwd") == 0 && i + 1 < argc) {
            working_dir_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            int64_t seconds = 0;
            if (!parse_seconds(argv[++i], seconds)) {
                std::cerr << "Invalid --timeout value: " << argv[i] << "\n";
                exit_code_ = EXIT_USAGE;
                return false;
            }
            timeout_ = seconds;
            continue;
        }
        if (strcmp(argv[i], "--audit-summary") == 0 && i + 1 < argc) {
            audit_summary_file_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--") == 0) {
            ++i;
            break;
        }
        if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown or incomplete option: " << argv[i] << "\n\n";
            print_usage(argv[0]);
            exit_code_ = EXIT_USAGE;
            return false;
        }
        break;
    }

    // Everything from here on belongs to the command
    if (i < argc) {
        program_ = argv[i++];
        for (; i < argc; ++i) {
            args_.push_back(argv[i]);
        }
    }

    if (program_.empty() && audit_summary_file_.empty()) {
        print_usage(argv[0]);
        exit_code_ = EXIT_USAGE;
        return false;
    }
    return true;
}

bool Application::load_config() {
    if (!config_explicit_ && !file_exists(config_file_)) {
        LOG_DEBUG("No %s found, using built-in defaults", config_file_.c_str());
        return true;
    }

    if (!config_.load_file(config_file_)) {
        LOG_ERROR("Failed to load config: %s", config_.last_error().c_str());
        return false;
    }
    LOG_INFO("Loaded config from %s", config_file_.c_str());
    return true;
}

void Application::setup_logging() {
    std::string log_level = config_.get_string("log_level", "info");
    Logger::instance().set_level(parse_log_level(log_level));
}

bool Application::setup_gateway() {
    Policy policy = Policy::from_config(config_);
    if (policy.whitelist.empty()) {
        LOG_WARN("policy.whitelist is empty, every command will be rejected");
    }

    std::shared_ptr<AuditRecorder> recorder;
    AuditConfig audit_config = AuditConfig::from_config(config_);
    if (audit_config.enabled) {
        recorder = std::make_shared<AuditRecorder>(audit_config.path, audit_config.digest_key);
        LOG_DEBUG("Audit trail: %s", audit_config.path.c_str());
    } else {
        LOG_WARN("Audit trail disabled by config (audit.enabled=false)");
    }

    gateway_.reset(new Gateway(policy, std::shared_ptr<ProcessRunner>(), recorder));
    return true;
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    if (!load_config()) {
        exit_code_ = EXIT_USAGE;
        return false;
    }
    setup_logging();

    LOG_DEBUG("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (audit_summary_file_.empty() && !setup_gateway()) {
        exit_code_ = EXIT_USAGE;
        return false;
    }
    return true;
}

int Application::run() {
    if (!audit_summary_file_.empty()) {
        exit_code_ = run_audit_summary();
    } else {
        exit_code_ = run_request();
    }
    return exit_code_;
}

void Application::shutdown() {
    if (gateway_ && gateway_->audit() && gateway_->audit()->failed_writes() > 0) {
        LOG_WARN("%zu audit record(s) could not be written to %s",
                 gateway_->audit()->failed_writes(), gateway_->audit()->path().c_str());
    }
    gateway_.reset();
    LOG_DEBUG("Shutdown complete");
}

int Application::exit_status_for(const GatewayResult& result) {
    if (result.is_rejected()) return EXIT_REJECTED;
    if (result.timed_out()) return EXIT_TIMED_OUT;
    if (!result.has_result) return EXIT_SPAWN_FAILED;
    if (result.result.exit_code) return *result.result.exit_code;
    // Killed by a signal, shell convention
    return 128 + result.result.term_signal;
}

int Application::run_request() {
    GatewayResult result = gateway_->execute(program_, args_, working_dir_, timeout_);

    // Child output is arbitrary bytes; invalid UTF-8 is replaced, not fatal
    std::cout << result.to_json().dump(2, ' ', false, Json::error_handler_t::replace) << std::endl;
    return exit_status_for(result);
}

int Application::run_audit_summary() {
    AuditLogContents contents;
    std::string error;
    if (!AuditLogReader::read_file(audit_summary_file_, contents, error)) {
        LOG_ERROR("%s", error.c_str());
        return EXIT_USAGE;
    }

    std::map<std::string, size_t> by_outcome;
    by_outcome[audit_outcome_name(AuditOutcome::ACCEPTED)] = 0;
    by_outcome[audit_outcome_name(AuditOutcome::REJECTED)] = 0;
    by_outcome[audit_outcome_name(AuditOutcome::TIMED_OUT)] = 0;
    by_outcome[audit_outcome_name(AuditOutcome::FAILED)] = 0;

    std::map<std::string, size_t> by_program;
    for (const auto& rec : contents.records) {
        by_outcome[audit_outcome_name(rec.outcome)]++;
        by_program[rec.program]++;
    }

    Json summary = Json::object();
    summary["file"] = audit_summary_file_;
    summary["records"] = contents.records.size();
    summary["corrupt_lines"] = contents.corrupt_lines;
    summary["outcomes"] = by_outcome;
    summary["programs"] = by_program;
    if (!contents.records.empty()) {
        summary["first"] = format_timestamp_ms(contents.records.front().timestamp_ms);
        summary["last"] = format_timestamp_ms(contents.records.back().timestamp_ms);
    }

    std::cout << summary.dump(2, ' ', false, Json::error_handler_t::replace) << std::endl;
    return 0;
}

} // namespace execgate
