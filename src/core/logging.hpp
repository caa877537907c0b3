#pragma once
#include <string>

namespace core {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4,
};

const char* log_level_to_string(LogLevel level);
// Accepts "debug", "info", "warning"/"warn", "error", "off" (case-insensitive).
bool parse_log_level(const std::string& text, LogLevel& out);

// Tagged stderr logger: "[Tag] message". Each engine instance owns one.
class Logger {
public:
    Logger(std::string tag, LogLevel level);

    const std::string& tag() const { return tag_; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level_ != LogLevel::Off && level >= level_; }

    void debug(const char* fmt, ...) const;
    void info(const char* fmt, ...) const;
    void warn(const char* fmt, ...) const;
    void error(const char* fmt, ...) const;

private:
    std::string tag_;
    LogLevel level_;
};

} // namespace core
