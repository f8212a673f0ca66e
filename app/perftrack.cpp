#include "perftrack/cli.hpp"

extern "C" {
#include <pthread.h>
#include <signal.h>
#include <time.h>
}

#include <cstdlib>
#include <exception>
#include <iostream>
#include <stop_token>
#include <thread>

namespace {

    // SIGINT/SIGTERM are blocked in every thread and consumed here; the first one requests a stop at
    // the next iteration boundary, a second one exits immediately (every appended row is already synced)
    void watch_signals(std::stop_token self, std::stop_source run) {
        sigset_t signals{};
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);

        timespec poll_interval{.tv_sec = 0, .tv_nsec = 100'000'000};
        while (!self.stop_requested()) {
            int sig = sigtimedwait(&signals, nullptr, &poll_interval);
            if (sig < 0) {
                continue;
            }
            if (run.stop_requested()) {
                std::_Exit(128 + sig);
            }
            std::cerr << "\ninterrupt received; finishing current sample (press again to exit now)\n";
            run.request_stop();
        }
    }

}  // namespace

int main(int argc, char** argv) {
    try {
        perftrack::startup_config cfg{};
        perftrack::cli::command_request request{};
        if (auto cli_result = perftrack::cli::parse_cli(argc, argv, cfg, request)) {
            return *cli_result;
        }

        sigset_t signals{};
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);

        std::stop_source run{};
        std::jthread watcher{watch_signals, run};

        auto rc = perftrack::cli::run_command(cfg, request, run.get_token(), std::cout, std::cerr);
        std::cout.flush();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
