#pragma once
#include <string>
#include <ostream>
#include <mutex>

namespace hookgate {

enum class LogLevel { Debug, Info, Warn, Error };

const char* log_level_name(LogLevel level);

// Process-wide log sink. Created once in main and passed by reference to
// everything that logs. Each call writes one complete line under a lock, so
// lines from concurrent request handlers never interleave.
class Logger {
public:
    explicit Logger(std::ostream& out, LogLevel min_level = LogLevel::Info,
                    std::string name = "hookgate");

    void log(LogLevel level, const std::string& component, const std::string& message);

    void debug(const std::string& component, const std::string& message) {
        log(LogLevel::Debug, component, message);
    }
    void info(const std::string& component, const std::string& message) {
        log(LogLevel::Info, component, message);
    }
    void warn(const std::string& component, const std::string& message) {
        log(LogLevel::Warn, component, message);
    }
    void error(const std::string& component, const std::string& message) {
        log(LogLevel::Error, component, message);
    }

    bool enabled(LogLevel level) const;
    void set_min_level(LogLevel level);

private:
    std::ostream& out_;
    std::string name_;
    mutable std::mutex mutex_;
    LogLevel min_level_;
};

} // namespace hookgate
