#include "log.hpp"
#include "util.hpp"

namespace hookgate {

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

Logger::Logger(std::ostream& out, LogLevel min_level, std::string name)
    : out_(out), name_(std::move(name)), min_level_(min_level)
{}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    // Build the whole line before taking the lock.
    std::string line = timestamp_now() + " - " + name_ + " - " + log_level_name(level) +
                       " - [" + component + "] " + message + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(min_level_)) return;
    out_ << line;
    out_.flush();
}

} // namespace hookgate
