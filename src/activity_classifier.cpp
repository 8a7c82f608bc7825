#include "activity_classifier.hpp"

CpuActivityClassifier::CpuActivityClassifier(uint64_t busy_ticks)
    : busy_ticks_(busy_ticks) {}

void CpuActivityClassifier::begin_cycle() {
    // Drops samples of processes that were not seen last cycle.
    previous_ = std::move(current_);
    current_.clear();
}

SessionStatus CpuActivityClassifier::classify(const ProcessFacts& facts) {
    Key key{facts.pid, facts.start_ticks};
    current_[key] = facts.cpu_ticks;

    if (facts.state == 'R' || facts.state == 'D') return SessionStatus::Running;

    auto it = previous_.find(key);
    if (it == previous_.end()) return SessionStatus::Idle;

    if (busy_ticks_ > 0 && facts.cpu_ticks >= it->second &&
        facts.cpu_ticks - it->second >= busy_ticks_) {
        return SessionStatus::Running;
    }
    return SessionStatus::Idle;
}
