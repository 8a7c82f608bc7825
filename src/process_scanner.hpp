#pragma once

#include "activity_classifier.hpp"
#include "live_session.hpp"
#include "platform/process_table.hpp"

#include <expected>
#include <stop_token>
#include <string>
#include <vector>

class ProcessScanner {
public:
    // home_dir is only used to abbreviate working directories for display.
    ProcessScanner(ProcessTable& table, ActivityClassifier& classifier,
                   std::string agent, std::string home_dir);

    // Running sessions of the agent in discovery order. Processes that vanish
    // or cannot be read mid-scan are skipped; the only error is an unreadable
    // process table. A stop request ends the traversal early.
    std::expected<std::vector<LiveSession>, std::string> scan(std::stop_token stop = {});

    // Exact, case-sensitive match of the base executable name.
    bool matches(const ProcessIdentity& id) const;

    static std::string abbreviate_home(const std::string& path, const std::string& home);

private:
    ProcessTable& table_;
    ActivityClassifier& classifier_;
    std::string agent_;
    std::string home_dir_;
};
