/*
 * execgate C++17 - Logger
 *
 * Process-wide stderr logger. Lines look like
 *   [2026-10-18 09:12:44] [WARN] Rejected 'rm' (2 args): NotWhitelisted
 * At DEBUG level the calling Class::function and file:line are added.
 */
#ifndef execgate_CORE_LOGGER_HPP
#define execgate_CORE_LOGGER_HPP

#include <string>
#include <mutex>
#include <cstdarg>

namespace execgate {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error". Unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_; }

    void log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void write(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    bool color_;        // Only when stderr is a terminal
    std::mutex mutex_;  // Whole lines, never interleaved
};

#define EXECGATE_LOG(lvl, ...) \
    do { \
        if (execgate::Logger::instance().enabled(lvl)) \
            execgate::Logger::instance().log(lvl, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__); \
    } while (0)

// Convenience macros
#define LOG_DEBUG(...) EXECGATE_LOG(execgate::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  EXECGATE_LOG(execgate::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  EXECGATE_LOG(execgate::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) EXECGATE_LOG(execgate::LogLevel::ERROR, __VA_ARGS__)

} // namespace execgate

#endif // execgate_CORE_LOGGER_HPP
