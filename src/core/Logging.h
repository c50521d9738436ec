#pragma once
#include <atomic>
#include <mutex>
#include <string>

namespace inviscan {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3, Trace = 4 };

// Process-wide logger. Writes "[LEVEL] message" lines to stderr so stdout
// only ever carries the rendered report.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }

    void log(LogLevel level, const std::string& msg);
    void error(const std::string& msg) { log(LogLevel::Error, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void trace(const std::string& msg) { log(LogLevel::Trace, msg); }

private:
    Logger() = default;
    const char* prefix(LogLevel level) const;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

// Accepts error|warn|info|debug|trace (case-insensitive).
bool parse_log_level(const std::string& name, LogLevel& out);

}
