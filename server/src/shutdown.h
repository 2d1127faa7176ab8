#pragma once
#include <atomic>
#include <functional>
#include <thread>

namespace devhttps {

// SIGINT/SIGTERM set a process-wide flag; SIGPIPE is ignored.
void install_shutdown_signals();

bool shutdown_requested();
int  shutdown_signal();       // 0 until a signal arrived
void clear_shutdown_request();

/*
ShutdownWatcher
===============

Signal handlers may only touch async-signal-safe state, and
httplib::Server::stop() is not that. The watcher is a small thread that polls
the flag every 100 ms and runs the callback (normally server.stop()) once,
outside signal context.
*/
class ShutdownWatcher {
public:
    ShutdownWatcher() = default;
    ~ShutdownWatcher();

    ShutdownWatcher(const ShutdownWatcher&) = delete;
    ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;

    void start(std::function<void()> on_shutdown);

    // Stop polling and join. Idempotent.
    void stop();

    bool fired() const { return fired_.load(); }

private:
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> fired_{false};
};

} // namespace devhttps
