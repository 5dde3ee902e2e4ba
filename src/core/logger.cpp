#include <execgate/core/logger.hpp>

#include <cstdio>
#include <cstring>
#include <ctime>
#include <unistd.h>

namespace execgate {

namespace {

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m"; // Blue
        case LogLevel::INFO: return "\033[32m";  // Green
        case LogLevel::WARN: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        default: return "\033[0m";
    }
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

// "execgate::RunOutcome execgate::PosixProcessRunner::run(const string&, ...)"
//   -> "PosixProcessRunner::run"
std::string short_function_name(const char* pretty_function) {
    std::string sig = pretty_function;

    size_t paren = sig.find('(');
    if (paren != std::string::npos) sig.erase(paren);

    // Drop the return type; template brackets may contain spaces
    int depth = 0;
    size_t name_start = 0;
    for (size_t i = 0; i < sig.size(); ++i) {
        if (sig[i] == '<') ++depth;
        else if (sig[i] == '>') --depth;
        else if (sig[i] == ' ' && depth == 0) name_start = i + 1;
    }
    sig.erase(0, name_start);

    while (!sig.empty() && (sig[0] == '*' || sig[0] == '&')) sig.erase(0, 1);

    static const char prefix[] = "execgate::";
    if (sig.compare(0, sizeof(prefix) - 1, prefix) == 0) {
        sig.erase(0, sizeof(prefix) - 1);
    }
    return sig;
}

const char* base_name(const char* path) {
    const char* slash = strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "warn") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(LogLevel::INFO), color_(isatty(STDERR_FILENO) == 1) {}

void Logger::log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...) {
    if (!enabled(level)) return;
    va_list args;
    va_start(args, fmt);
    write(level, file, line, func, fmt, args);
    va_end(args);
}

void Logger::write(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    const char* color = color_ ? level_color(level) : "";
    const char* reset = color_ ? "\033[0m" : "";

    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(stderr, "[%s] %s[%s]%s ", timestamp, color, level_name(level), reset);
    if (level_ == LogLevel::DEBUG) {
        fprintf(stderr, "%s(%s)%s at %s%s:%d%s ",
                color_ ? "\033[36m" : "", short_function_name(func).c_str(), reset,
                color_ ? "\033[33m" : "", base_name(file), line, reset);
    }
    vfprintf(stderr, fmt, args);
    fputc('\n', stderr);
    fflush(stderr);
}

} // namespace execgate
