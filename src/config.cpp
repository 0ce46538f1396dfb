#include "../include/localocr/config.hpp"

#include <cstdlib>
#include <system_error>

namespace localocr {

namespace {

LogLevel log_level_from_environment() {
    const std::string raw = read_environment_variable("LOCALOCR_LOG_LEVEL");
    if (raw.empty()) {
        return LogLevel::Info;
    }
    if (auto level = parse_log_level(raw)) {
        return *level;
    }
    return LogLevel::Info;
}

std::filesystem::path default_server_binary() {
    std::error_code ec;
    const std::filesystem::path self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || self.empty()) {
        return std::filesystem::path("local-ocr-server");
    }
    return self.parent_path() / "local-ocr-server";
}

} // namespace

std::string read_environment_variable(const char* name) {
    if (const char* raw = std::getenv(name)) {
        return std::string(raw);
    }
    return {};
}

long read_environment_long(const char* name, long fallback) {
    const std::string raw = read_environment_variable(name);
    if (raw.empty()) {
        return fallback;
    }
    char* end = nullptr;
    const long candidate = std::strtol(raw.c_str(), &end, 10);
    if (end != raw.c_str() && *end == '\0' && candidate > 0) {
        return candidate;
    }
    log_warning("Config", std::string("ignoring invalid value for ") + name + ": " + raw);
    return fallback;
}

ServerConfig ServerConfig::from_environment() {
    ServerConfig config;

    const std::string temp = read_environment_variable("LOCALOCR_TEMP_DIR");
    if (!temp.empty()) {
        config.temp_dir = temp;
    } else {
        std::error_code ec;
        std::filesystem::path base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            base = "/tmp";
        }
        config.temp_dir = base / "local-ocr";
    }

    config.tessdata_dir = read_environment_variable("LOCALOCR_TESSDATA");
    config.download_timeout_ms = read_environment_long("LOCALOCR_HTTP_TIMEOUT_MS", config.download_timeout_ms);
    config.max_download_bytes = static_cast<std::size_t>(
        read_environment_long("LOCALOCR_MAX_DOWNLOAD_BYTES", static_cast<long>(config.max_download_bytes)));
    config.log_level = log_level_from_environment();
    config.supervised = !read_environment_variable(kSupervisedEnvVar).empty();
    return config;
}

SupervisorConfig SupervisorConfig::from_environment(int argc, char** argv) {
    SupervisorConfig config;
    if (argc > 1 && argv[1] != nullptr && argv[1][0] != '\0') {
        config.server_binary = argv[1];
    } else {
        const std::string configured = read_environment_variable("LOCALOCR_SERVER_BIN");
        config.server_binary = configured.empty() ? default_server_binary() : std::filesystem::path(configured);
    }
    config.log_level = log_level_from_environment();
    return config;
}

} // namespace localocr
