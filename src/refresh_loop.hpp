#pragma once

#include "session_monitor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>

enum class LoopState { Idle, Scanning, Rendering, Sleeping, Cancelled };

// Presentation seam: draws whatever the loop hands it.
class SessionView {
public:
    virtual ~SessionView() = default;
    virtual void render(const Snapshot& snapshot) = 0;
    virtual void render_error(const std::string& message, uint32_t consecutive_failures) = 0;
};

class Waiter {
public:
    virtual ~Waiter() = default;
    // Sleeps up to `timeout`. Returns false if a stop was requested.
    virtual bool wait_for(std::chrono::milliseconds timeout, std::stop_token stop) = 0;
};

class StopTokenWaiter : public Waiter {
public:
    bool wait_for(std::chrono::milliseconds timeout, std::stop_token stop) override;

private:
    std::mutex mutex_;
    std::condition_variable_any cv_;
};

class RefreshLoop {
public:
    using ScanFn = std::function<std::expected<Snapshot, std::string>(std::stop_token)>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct Options {
        std::chrono::milliseconds period{3000};
        // 0 disables the limit.
        uint32_t max_consecutive_failures = 5;
    };

    RefreshLoop(ScanFn scan, SessionView& view, Waiter& waiter, Options options,
                Clock clock = [] { return std::chrono::steady_clock::now(); });

    RefreshLoop(const RefreshLoop&) = delete;
    RefreshLoop& operator=(const RefreshLoop&) = delete;

    // Scan, render, sleep until cancelled. Returns an error only when the
    // consecutive failure limit is reached.
    std::expected<void, std::string> run();

    // Safe from any thread.
    void request_stop();

    LoopState state() const { return state_.load(std::memory_order_acquire); }
    uint64_t cycles() const { return cycles_.load(std::memory_order_acquire); }

private:
    void set_state(LoopState s) { state_.store(s, std::memory_order_release); }

    ScanFn scan_;
    SessionView& view_;
    Waiter& waiter_;
    Options options_;
    Clock clock_;

    std::stop_source stop_;
    std::atomic<LoopState> state_{LoopState::Idle};
    std::atomic<uint64_t> cycles_{0};
    uint32_t consecutive_failures_ = 0;
};
