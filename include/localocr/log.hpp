#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace localocr {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

std::optional<LogLevel> parse_log_level(std::string_view name);

// Lines go to stderr only; stdout carries protocol frames.
void set_log_threshold(LogLevel level) noexcept;
LogLevel log_threshold() noexcept;

void log(LogLevel level, std::string_view component, std::string_view message);

inline void log_debug(std::string_view component, std::string_view message) {
    log(LogLevel::Debug, component, message);
}

inline void log_info(std::string_view component, std::string_view message) {
    log(LogLevel::Info, component, message);
}

inline void log_warning(std::string_view component, std::string_view message) {
    log(LogLevel::Warning, component, message);
}

inline void log_error(std::string_view component, std::string_view message) {
    log(LogLevel::Error, component, message);
}

} // namespace localocr
