#pragma once

#include "platform/process_table.hpp"

#include <cstdint>
#include <string>

class ProcfsProcessTable : public ProcessTable {
public:
    explicit ProcfsProcessTable(std::string proc_root = "/proc");

    std::expected<std::vector<int>, std::string> list_pids() override;
    std::optional<ProcessIdentity> identify(int pid) override;
    std::optional<ProcessFacts> inspect(int pid) override;

    // Device name for the tty_nr field of /proc/<pid>/stat, empty for none.
    static std::string decode_tty(int tty_nr);

private:
    std::string pid_path(int pid, const char* leaf) const;
    std::string read_comm(int pid) const;
    std::string read_argv0(int pid) const;
    std::string read_cwd(int pid) const;

    // Seconds since boot from /proc/uptime, negative on failure.
    double read_boot_uptime() const;
    uint64_t read_boot_time() const;

    std::string proc_root_;
    long clock_ticks_ = 100;
    uint64_t boot_time_s_ = 0;
};
