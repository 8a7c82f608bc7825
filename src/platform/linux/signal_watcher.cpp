#include "platform/linux/signal_watcher.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

SignalWatcher::SignalWatcher(SignalCallback on_signal)
    : on_signal_(std::move(on_signal)) {}

SignalWatcher::~SignalWatcher() {
    shutdown();
    if (thread_.joinable()) thread_.join();

    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

bool SignalWatcher::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (int rc = pthread_sigmask(SIG_BLOCK, &mask, nullptr); rc != 0) {
        std::println(stderr, "pthread_sigmask failed: {}", std::strerror(rc));
        return false;
    }

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(wake_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    thread_ = std::jthread([this] { run(); });
    return true;
}

void SignalWatcher::shutdown() {
    if (wake_fd_ < 0) return;
    uint64_t val = 1;
    if (::write(wake_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "signal watcher: wake failed: {}", std::strerror(errno));
    }
}

void SignalWatcher::run() {
    constexpr int MAX_EVENTS = 4;
    epoll_event events[MAX_EVENTS];

    while (true) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            return;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == wake_fd_) return;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) != sizeof(info)) continue;
                if (on_signal_) on_signal_(static_cast<int>(info.ssi_signo));
            }
        }
    }
}
