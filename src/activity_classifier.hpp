#pragma once

#include "live_session.hpp"
#include "platform/process_table.hpp"

#include <cstdint>
#include <map>
#include <utility>

class ActivityClassifier {
public:
    virtual ~ActivityClassifier() = default;

    // Called once at the start of every scan.
    virtual void begin_cycle() {}
    virtual SessionStatus classify(const ProcessFacts& facts) = 0;
};

// Running if the kernel has the process runnable or in disk wait, or if it
// burned at least busy_ticks of CPU since the previous cycle.
class CpuActivityClassifier : public ActivityClassifier {
public:
    explicit CpuActivityClassifier(uint64_t busy_ticks);

    void begin_cycle() override;
    SessionStatus classify(const ProcessFacts& facts) override;

private:
    // (pid, start ticks) so a reused pid never inherits an old sample
    using Key = std::pair<int, uint64_t>;

    uint64_t busy_ticks_;
    std::map<Key, uint64_t> previous_;
    std::map<Key, uint64_t> current_;
};
