#pragma once

#include "log.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace localocr {

inline constexpr const char* kServerName = "local-ocr";
inline constexpr const char* kServerVersion = "1.0.0";
inline constexpr const char* kSupervisedEnvVar = "LOCALOCR_SUPERVISED";

std::string read_environment_variable(const char* name);
long read_environment_long(const char* name, long fallback);

struct ServerConfig {
    std::filesystem::path temp_dir;
    std::string tessdata_dir;
    long download_timeout_ms = 30000;
    std::size_t max_download_bytes = 10 * 1024 * 1024;
    LogLevel log_level = LogLevel::Info;
    bool supervised = false;

    static ServerConfig from_environment();
};

struct SupervisorConfig {
    std::filesystem::path server_binary;
    std::size_t max_restarts = 5;
    std::chrono::milliseconds restart_window{60000};
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    LogLevel log_level = LogLevel::Info;

    // argv[1], when present, names the server binary.
    static SupervisorConfig from_environment(int argc, char** argv);
};

} // namespace localocr
