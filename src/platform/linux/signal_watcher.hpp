#pragma once

#include <functional>
#include <thread>

// Turns SIGINT/SIGTERM into a callback on a dedicated thread, so the main
// loop can be cancelled while it sleeps or scans.
class SignalWatcher {
public:
    using SignalCallback = std::function<void(int signo)>;

    explicit SignalWatcher(SignalCallback on_signal);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Must run before any other thread is started: the signals are blocked
    // for the calling thread and inherited by threads created afterwards.
    bool init();

    // Stops the watcher thread without a signal.
    void shutdown();

private:
    void run();

    SignalCallback on_signal_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int wake_fd_ = -1;

    std::jthread thread_;
};
