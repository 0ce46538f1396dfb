#include <csignal>
#include <exception>
#include <string>

#include <pthread.h>

#include "../include/localocr/config.hpp"
#include "../include/localocr/log.hpp"
#include "../include/localocr/supervisor.hpp"

int main(int argc, char** argv) {
    using namespace localocr;

    // Block before anything else so no thread ever takes the default action.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        const SupervisorConfig config = SupervisorConfig::from_environment(argc, argv);
        set_log_threshold(config.log_level);
        log_info("Supervisor", "supervising " + config.server_binary.string());

        ProcessSupervisor supervisor(config);
        const int code = supervisor.run();
        log_info("Supervisor", std::string("finished in state ") + supervisor_state_to_string(supervisor.state()) +
                                   " with exit code " + std::to_string(code));
        return code;
    } catch (const std::exception& ex) {
        log_error("Supervisor", std::string("fatal: ") + ex.what());
        return 1;
    }
}
