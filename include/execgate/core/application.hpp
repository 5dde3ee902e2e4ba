/*
 * execgate C++17 - Command-line Application
 *
 * Loads config.json, builds a Gateway and runs one request, printing the
 * GatewayResult as JSON on stdout:
 *
 *   execgate [--config FILE] [--cwd DIR] [--timeout SECONDS] [--] PROGRAM [ARGS...]
 *   execgate [--config FILE] --audit-summary FILE
 */
#ifndef execgate_CORE_APPLICATION_HPP
#define execgate_CORE_APPLICATION_HPP

#include <execgate/core/config.hpp>
#include <execgate/core/policy.hpp>
#include <execgate/core/audit.hpp>
#include <execgate/core/gateway.hpp>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>

namespace execgate {

struct AppInfo {
    static constexpr const char* NAME = "execgate";
    static constexpr const char* VERSION = "1.0.0";
};

// Process exit statuses for non-child outcomes
enum ExitStatus {
    EXIT_USAGE = 1,
    EXIT_REJECTED = 2,
    EXIT_TIMED_OUT = 124,
    EXIT_SPAWN_FAILED = 126
};

class Application {
public:
    static Application& instance();

    // Returns false for --help/--version or fatal errors; exit_code() says which
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    int exit_code() const { return exit_code_; }

    // Map a gateway result onto a process exit status
    static int exit_status_for(const GatewayResult& result);

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool setup_gateway();

    int run_request();
    int run_audit_summary();

    Config config_;
    std::string config_file_;
    bool config_explicit_;
    std::unique_ptr<Gateway> gateway_;

    std::string program_;
    std::vector<std::string> args_;
    std::optional<std::string> working_dir_;
    std::optional<int64_t> timeout_;
    std::string audit_summary_file_;
    int exit_code_;
};

} // namespace execgate

#endif // execgate_CORE_APPLICATION_HPP
