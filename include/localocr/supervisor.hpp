#pragma once

#include "config.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <optional>

#include <sys/types.h>

namespace localocr {

// Exponential backoff plus a sliding-window cap on restarts. Time is always
// passed in so the policy can be driven without a real clock.
class RestartPolicy {
public:
    using Clock = std::chrono::steady_clock;

    struct Limits {
        std::size_t max_restarts = 5;
        std::chrono::milliseconds window{60000};
        std::chrono::milliseconds initial_delay{1000};
        std::chrono::milliseconds max_delay{30000};
    };

    RestartPolicy();
    explicit RestartPolicy(Limits limits);

    // Records a crash at `now` and returns how long to wait before relaunching.
    std::chrono::milliseconds record_crash(Clock::time_point now);

    // Drops records older than the window; false once the budget is spent.
    bool may_restart(Clock::time_point now);

    std::chrono::milliseconds current_delay() const noexcept { return m_current_delay; }
    std::size_t recent_restarts() const noexcept { return m_records.size(); }
    const Limits& limits() const noexcept { return m_limits; }

private:
    Limits m_limits;
    std::chrono::milliseconds m_current_delay;
    std::deque<Clock::time_point> m_records;

    void prune(Clock::time_point now);
};

class ProcessSupervisor {
public:
    enum class State { Idle, Running, CrashDetected, CleanExit, ShuttingDown, Terminated };

    explicit ProcessSupervisor(SupervisorConfig config);

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Blocks until the server exits cleanly, shutdown is requested, or the
    // restart budget runs out. Returns the process exit code to use.
    int run();

    // Safe to call from any thread.
    void request_shutdown() noexcept;

    State state() const noexcept { return m_state.load(); }
    const RestartPolicy& policy() const noexcept { return m_policy; }

private:
    SupervisorConfig m_config;
    RestartPolicy m_policy;
    std::atomic<State> m_state{State::Idle};
    std::atomic<bool> m_shutdown_requested{false};
    bool m_permissions_fixed = false;
    pid_t m_child = -1;

    int supervise();
    bool ensure_executable();
    std::optional<pid_t> spawn_server();
    int wait_for_child();
    bool sleep_interruptibly(std::chrono::milliseconds delay);
    bool poll_signals(std::chrono::milliseconds timeout);
    void forward_termination();
    void terminate_child() noexcept;
};

const char* supervisor_state_to_string(ProcessSupervisor::State state) noexcept;

} // namespace localocr
