#include "core/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>

namespace core {

namespace {

void vlog(const std::string& tag, const char* prefix, const char* fmt, va_list args) {
    char buf[1024];
    vsnprintf(buf, sizeof(buf), fmt, args);
    if (prefix[0] != '\0') {
        fprintf(stderr, "[%s] %s: %s\n", tag.c_str(), prefix, buf);
    } else {
        fprintf(stderr, "[%s] %s\n", tag.c_str(), buf);
    }
}

} // namespace

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

bool parse_log_level(const std::string& text, LogLevel& out) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "debug") { out = LogLevel::Debug; return true; }
    if (s == "info") { out = LogLevel::Info; return true; }
    if (s == "warning" || s == "warn") { out = LogLevel::Warning; return true; }
    if (s == "error") { out = LogLevel::Error; return true; }
    if (s == "off" || s == "none") { out = LogLevel::Off; return true; }
    return false;
}

Logger::Logger(std::string tag, LogLevel level)
    : tag_(std::move(tag)), level_(level) {}

void Logger::debug(const char* fmt, ...) const {
    if (!enabled(LogLevel::Debug)) return;
    va_list args;
    va_start(args, fmt);
    vlog(tag_, "", fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) const {
    if (!enabled(LogLevel::Info)) return;
    va_list args;
    va_start(args, fmt);
    vlog(tag_, "", fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) const {
    if (!enabled(LogLevel::Warning)) return;
    va_list args;
    va_start(args, fmt);
    vlog(tag_, "Warning", fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) const {
    if (!enabled(LogLevel::Error)) return;
    va_list args;
    va_start(args, fmt);
    vlog(tag_, "Error", fmt, args);
    va_end(args);
}

} // namespace core
