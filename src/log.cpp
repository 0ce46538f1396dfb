#include "../include/localocr/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace localocr {

namespace {

std::atomic<LogLevel> g_threshold{LogLevel::Info};

std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::string timestamp_now() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto time = clock::to_time_t(now);
    std::tm tm {};
    localtime_r(&time, &tm);
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << milliseconds.count();
    return oss.str();
}

} // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warning" || lowered == "warn") {
        return LogLevel::Warning;
    }
    if (lowered == "error") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

void set_log_threshold(LogLevel level) noexcept {
    g_threshold.store(level);
}

LogLevel log_threshold() noexcept {
    return g_threshold.load();
}

void log(LogLevel level, std::string_view component, std::string_view message) {
    if (level < g_threshold.load()) {
        return;
    }
    std::ostringstream line;
    line << '[' << component << ' ' << timestamp_now() << "] ";
    if (level == LogLevel::Warning) {
        line << "warning: ";
    } else if (level == LogLevel::Error) {
        line << "error: ";
    }
    line << message << '\n';

    std::scoped_lock lock(log_mutex());
    std::cerr << line.str();
    std::cerr.flush();
}

} // namespace localocr
