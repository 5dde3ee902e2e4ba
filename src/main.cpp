/*
 * execgate C++17 - Secure external command gateway
 *
 * Usage:
 *   ./execgate [--config config.json] [--cwd DIR] [--timeout S] -- PROGRAM [ARGS...]
 *   ./execgate [--config config.json] --audit-summary FILE
 *
 * Policy and audit settings are read from config.json.
 */
#include <execgate/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = execgate::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
