#include "shutdown.h"

#include <chrono>
#include <csignal>
#include <utility>

namespace devhttps {

static volatile std::sig_atomic_t g_shutdown_signal = 0;

extern "C" void devhttps_on_shutdown_signal(int signum) {
    g_shutdown_signal = signum;
}

void install_shutdown_signals() {
    struct sigaction sa{};
    sa.sa_handler = devhttps_on_shutdown_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;   // no SA_RESTART: let blocking accept() see EINTR
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);

    // A client that drops the connection mid-write must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
}

bool shutdown_requested() {
    return g_shutdown_signal != 0;
}

int shutdown_signal() {
    return (int)g_shutdown_signal;
}

void clear_shutdown_request() {
    g_shutdown_signal = 0;
}

ShutdownWatcher::~ShutdownWatcher() {
    stop();
}

void ShutdownWatcher::start(std::function<void()> on_shutdown) {
    stop();
    stop_.store(false);
    fired_.store(false);

    thread_ = std::thread([this, cb = std::move(on_shutdown)]() {
        while (!stop_.load()) {
            if (shutdown_requested()) {
                fired_.store(true);
                if (cb) cb();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ShutdownWatcher::stop() {
    stop_.store(true);
    if (thread_.joinable()) thread_.join();
}

} // namespace devhttps
