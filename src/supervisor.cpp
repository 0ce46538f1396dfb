#include "../include/localocr/supervisor.hpp"
#include "../include/localocr/log.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <pthread.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace localocr {

namespace {

constexpr std::chrono::milliseconds kPollInterval{200};

sigset_t termination_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

// Keeps SIGINT/SIGTERM blocked on the supervising thread so they are
// collected with sigtimedwait instead of killing the process.
class SignalMaskGuard {
public:
    SignalMaskGuard() {
        const sigset_t set = termination_signals();
        m_active = pthread_sigmask(SIG_BLOCK, &set, &m_previous) == 0;
    }
    ~SignalMaskGuard() {
        if (m_active) {
            pthread_sigmask(SIG_SETMASK, &m_previous, nullptr);
        }
    }
    SignalMaskGuard(const SignalMaskGuard&) = delete;
    SignalMaskGuard& operator=(const SignalMaskGuard&) = delete;

private:
    sigset_t m_previous{};
    bool m_active = false;
};

class SpawnAttributes {
public:
    SpawnAttributes() {
        if (posix_spawnattr_init(&m_attr) != 0) {
            throw std::runtime_error("posix_spawnattr_init failed");
        }
        sigset_t empty;
        sigemptyset(&empty);
        sigset_t defaults = termination_signals();
        sigaddset(&defaults, SIGCHLD);
        posix_spawnattr_setsigmask(&m_attr, &empty);
        posix_spawnattr_setsigdefault(&m_attr, &defaults);
        posix_spawnattr_setflags(&m_attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
    }
    ~SpawnAttributes() { posix_spawnattr_destroy(&m_attr); }
    SpawnAttributes(const SpawnAttributes&) = delete;
    SpawnAttributes& operator=(const SpawnAttributes&) = delete;

    const posix_spawnattr_t* get() const noexcept { return &m_attr; }

private:
    posix_spawnattr_t m_attr;
};

std::vector<std::string> child_environment() {
    const std::string marker = std::string(kSupervisedEnvVar) + "=";
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string value(*entry);
        if (value.compare(0, marker.size(), marker) != 0) {
            env.push_back(std::move(value));
        }
    }
    env.push_back(marker + "1");
    return env;
}

bool is_clean_exit(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status) == 0;
    }
    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        return sig == SIGINT || sig == SIGTERM;
    }
    return false;
}

int exit_code_for(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status) && (WTERMSIG(status) == SIGINT || WTERMSIG(status) == SIGTERM)) {
        return 0;
    }
    return 1;
}

std::string describe_status(int status) {
    if (WIFEXITED(status)) {
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        const char* name = strsignal(sig);
        return "killed by signal " + std::to_string(sig) + (name ? std::string(" (") + name + ")" : std::string{});
    }
    return "stopped with status " + std::to_string(status);
}

std::string format_ms(std::chrono::milliseconds value) {
    return std::to_string(value.count()) + "ms";
}

} // namespace

RestartPolicy::RestartPolicy() : RestartPolicy(Limits{}) {}

RestartPolicy::RestartPolicy(Limits limits)
    : m_limits(limits), m_current_delay(limits.initial_delay) {
    if (m_limits.max_delay < m_limits.initial_delay) {
        m_limits.max_delay = m_limits.initial_delay;
    }
}

std::chrono::milliseconds RestartPolicy::record_crash(Clock::time_point now) {
    m_records.push_back(now);
    const std::chrono::milliseconds delay = m_current_delay;
    m_current_delay = std::min(m_current_delay * 2, m_limits.max_delay);
    return delay;
}

bool RestartPolicy::may_restart(Clock::time_point now) {
    prune(now);
    return m_records.size() < m_limits.max_restarts;
}

void RestartPolicy::prune(Clock::time_point now) {
    while (!m_records.empty() && now - m_records.front() > m_limits.window) {
        m_records.pop_front();
    }
}

ProcessSupervisor::ProcessSupervisor(SupervisorConfig config)
    : m_config(std::move(config)),
      m_policy(RestartPolicy::Limits{m_config.max_restarts, m_config.restart_window,
                                     m_config.initial_delay, m_config.max_delay}) {}

int ProcessSupervisor::run() {
    SignalMaskGuard mask;
    try {
        return supervise();
    } catch (const std::exception& ex) {
        log_error("Supervisor", std::string("supervisor failure: ") + ex.what());
        m_shutdown_requested.store(true);
        m_state.store(State::ShuttingDown);
        terminate_child();
        m_state.store(State::Terminated);
        return 1;
    }
}

void ProcessSupervisor::request_shutdown() noexcept {
    m_shutdown_requested.store(true);
}

int ProcessSupervisor::supervise() {
    std::error_code ec;
    if (!std::filesystem::exists(m_config.server_binary, ec)) {
        log_error("Supervisor", "server binary not found: " + m_config.server_binary.string());
        m_state.store(State::Terminated);
        return 1;
    }

    for (;;) {
        if (m_shutdown_requested.load()) {
            m_state.store(State::Terminated);
            return 0;
        }
        if (!m_policy.may_restart(RestartPolicy::Clock::now())) {
            log_error("Supervisor", "server crashed " + std::to_string(m_policy.recent_restarts()) +
                                        " times within " + format_ms(m_policy.limits().window) +
                                        "; giving up");
            m_state.store(State::Terminated);
            return 1;
        }

        std::optional<pid_t> pid;
        if (ensure_executable()) {
            pid = spawn_server();
        }

        if (pid) {
            m_child = *pid;
            m_state.store(State::Running);
            log_info("Supervisor", "server started (pid " + std::to_string(m_child) + ")");

            const int status = wait_for_child();
            if (m_shutdown_requested.load()) {
                log_info("Supervisor", "server " + describe_status(status) + " during shutdown");
                m_state.store(State::Terminated);
                return exit_code_for(status);
            }
            if (is_clean_exit(status)) {
                log_info("Supervisor", "server " + describe_status(status) + "; exiting");
                m_state.store(State::CleanExit);
                return exit_code_for(status);
            }
            log_warning("Supervisor", "server " + describe_status(status));
        }

        m_state.store(State::CrashDetected);
        const std::chrono::milliseconds delay = m_policy.record_crash(RestartPolicy::Clock::now());
        log_info("Supervisor", "restarting in " + format_ms(delay));
        if (!sleep_interruptibly(delay)) {
            m_state.store(State::Terminated);
            return 0;
        }
        m_state.store(State::Idle);
    }
}

bool ProcessSupervisor::ensure_executable() {
    const std::string path = m_config.server_binary.string();
    if (access(path.c_str(), X_OK) == 0) {
        return true;
    }
    if (m_permissions_fixed) {
        log_error("Supervisor", "server binary is not executable: " + path);
        return false;
    }

    m_permissions_fixed = true;
    log_warning("Supervisor", "server binary is not executable; adding execute permission");
    std::error_code ec;
    std::filesystem::permissions(m_config.server_binary,
                                 std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_exec,
                                 std::filesystem::perm_options::add, ec);
    if (ec) {
        log_error("Supervisor", "failed to fix permissions on " + path + ": " + ec.message());
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::optional<pid_t> ProcessSupervisor::spawn_server() {
    const std::string path = m_config.server_binary.string();
    std::vector<std::string> env = child_environment();

    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& entry : env) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::string arg0 = path;
    char* argv[] = {arg0.data(), nullptr};

    SpawnAttributes attributes;
    pid_t pid = -1;
    const int rc = posix_spawn(&pid, path.c_str(), nullptr, attributes.get(), argv, envp.data());
    if (rc != 0) {
        log_error("Supervisor", "failed to start " + path + ": " + std::strerror(rc));
        return std::nullopt;
    }
    return pid;
}

int ProcessSupervisor::wait_for_child() {
    bool forwarded = false;
    for (;;) {
        int status = 0;
        const pid_t reaped = waitpid(m_child, &status, WNOHANG);
        if (reaped == m_child) {
            m_child = -1;
            return status;
        }
        if (reaped < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
        if (poll_signals(kPollInterval) && !forwarded) {
            forward_termination();
            forwarded = true;
        }
    }
}

bool ProcessSupervisor::sleep_interruptibly(std::chrono::milliseconds delay) {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    for (;;) {
        if (m_shutdown_requested.load()) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (poll_signals(std::min(remaining, kPollInterval))) {
            return false;
        }
    }
}

// Waits up to `timeout` for SIGINT/SIGTERM; true once shutdown is requested.
bool ProcessSupervisor::poll_signals(std::chrono::milliseconds timeout) {
    const sigset_t set = termination_signals();
    timespec ts{};
    ts.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    ts.tv_nsec = static_cast<long>((timeout.count() % 1000) * 1000000);

    siginfo_t info{};
    const int sig = sigtimedwait(&set, &info, &ts);
    if (sig == SIGINT || sig == SIGTERM) {
        log_info("Supervisor", std::string("received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") + "; shutting down");
        request_shutdown();
    }
    return m_shutdown_requested.load();
}

void ProcessSupervisor::forward_termination() {
    m_state.store(State::ShuttingDown);
    if (m_child > 0) {
        log_info("Supervisor", "forwarding SIGTERM to server (pid " + std::to_string(m_child) + ")");
        if (kill(m_child, SIGTERM) != 0 && errno != ESRCH) {
            log_warning("Supervisor", std::string("kill failed: ") + std::strerror(errno));
        }
    }
}

void ProcessSupervisor::terminate_child() noexcept {
    if (m_child <= 0) {
        return;
    }
    kill(m_child, SIGTERM);
    int status = 0;
    while (waitpid(m_child, &status, 0) < 0 && errno == EINTR) {
    }
    m_child = -1;
}

const char* supervisor_state_to_string(ProcessSupervisor::State state) noexcept {
    switch (state) {
    case ProcessSupervisor::State::Idle:
        return "idle";
    case ProcessSupervisor::State::Running:
        return "running";
    case ProcessSupervisor::State::CrashDetected:
        return "crash-detected";
    case ProcessSupervisor::State::CleanExit:
        return "clean-exit";
    case ProcessSupervisor::State::ShuttingDown:
        return "shutting-down";
    case ProcessSupervisor::State::Terminated:
        return "terminated";
    }
    return "unknown";
}

} // namespace localocr
