#include "refresh_loop.hpp"

#include <format>

bool StopTokenWaiter::wait_for(std::chrono::milliseconds timeout, std::stop_token stop) {
    std::unique_lock lock(mutex_);
    // Returns true only if the predicate (stop requested) became true.
    bool stopped = cv_.wait_for(lock, stop, timeout, [] { return false; });
    return !stopped && !stop.stop_requested();
}

RefreshLoop::RefreshLoop(ScanFn scan, SessionView& view, Waiter& waiter, Options options, Clock clock)
    : scan_(std::move(scan)), view_(view), waiter_(waiter),
      options_(options), clock_(std::move(clock)) {}

std::expected<void, std::string> RefreshLoop::run() {
    auto token = stop_.get_token();

    while (!token.stop_requested()) {
        set_state(LoopState::Scanning);
        auto started = clock_();
        auto result = scan_(token);
        if (token.stop_requested()) break;

        set_state(LoopState::Rendering);
        if (result) {
            consecutive_failures_ = 0;
            view_.render(*result);
        } else {
            ++consecutive_failures_;
            view_.render_error(result.error(), consecutive_failures_);
            if (options_.max_consecutive_failures > 0 &&
                consecutive_failures_ >= options_.max_consecutive_failures) {
                set_state(LoopState::Cancelled);
                return std::unexpected(std::format("giving up after {} consecutive failures: {}",
                                                   consecutive_failures_, result.error()));
            }
        }
        cycles_.fetch_add(1, std::memory_order_acq_rel);

        set_state(LoopState::Sleeping);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - started);
        if (elapsed < options_.period) {
            if (!waiter_.wait_for(options_.period - elapsed, token)) break;
        }
    }

    set_state(LoopState::Cancelled);
    return {};
}

void RefreshLoop::request_stop() {
    stop_.request_stop();
}
