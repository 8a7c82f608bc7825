#include "platform/linux/procfs_process_table.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <string_view>
#include <unistd.h>

namespace fs = std::filesystem;

ProcfsProcessTable::ProcfsProcessTable(std::string proc_root)
    : proc_root_(std::move(proc_root)) {
    long ticks = sysconf(_SC_CLK_TCK);
    if (ticks > 0) clock_ticks_ = ticks;
    boot_time_s_ = read_boot_time();
}

std::expected<std::vector<int>, std::string> ProcfsProcessTable::list_pids() {
    std::vector<int> pids;

    std::error_code ec;
    fs::directory_iterator it(proc_root_, ec);
    if (ec) {
        return std::unexpected(std::format("cannot list {}: {}", proc_root_, ec.message()));
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        auto name = it->path().filename().string();
        int pid = 0;
        auto [ptr, pec] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (pec != std::errc{} || ptr != name.data() + name.size() || pid <= 0) continue;
        pids.push_back(pid);
    }

    if (ec && pids.empty()) {
        return std::unexpected(std::format("cannot list {}: {}", proc_root_, ec.message()));
    }
    return pids;
}

std::optional<ProcessIdentity> ProcfsProcessTable::identify(int pid) {
    if (pid <= 0) return std::nullopt;

    ProcessIdentity id{.comm = read_comm(pid), .argv0 = read_argv0(pid)};
    if (id.comm.empty() && id.argv0.empty()) return std::nullopt;
    return id;
}

std::optional<ProcessFacts> ProcfsProcessTable::inspect(int pid) {
    if (pid <= 0) return std::nullopt;

    std::ifstream f(pid_path(pid, "stat"));
    if (!f.is_open()) return std::nullopt;
    std::string stat;
    std::getline(f, stat);

    // comm may contain spaces and parentheses; fields resume after the last ')'
    auto comm_end = stat.rfind(')');
    if (comm_end == std::string::npos || comm_end + 2 >= stat.size()) return std::nullopt;

    std::istringstream iss(stat.substr(comm_end + 2));
    std::string state;
    int ppid = 0, pgrp = 0, session = 0, tty_nr = 0, tpgid = 0;
    unsigned int flags = 0;
    uint64_t minflt = 0, cminflt = 0, majflt = 0, cmajflt = 0, utime = 0, stime = 0;
    int64_t cutime = 0, cstime = 0, priority = 0, nice = 0, num_threads = 0, itrealvalue = 0;
    uint64_t starttime = 0;

    iss >> state >> ppid >> pgrp >> session >> tty_nr >> tpgid >> flags
        >> minflt >> cminflt >> majflt >> cmajflt >> utime >> stime
        >> cutime >> cstime >> priority >> nice >> num_threads >> itrealvalue >> starttime;
    if (iss.fail()) return std::nullopt;

    // Unreadable cwd (other user's process, or it just exited) means skip.
    auto cwd = read_cwd(pid);
    if (cwd.empty()) return std::nullopt;

    ProcessFacts facts;
    facts.pid = pid;
    facts.working_dir = std::move(cwd);
    facts.terminal = decode_tty(tty_nr);
    facts.state = state.empty() ? '?' : state[0];
    facts.start_ticks = starttime;
    facts.cpu_ticks = utime + stime;

    double started_after_boot = static_cast<double>(starttime) / static_cast<double>(clock_ticks_);
    facts.start_epoch_s = static_cast<double>(boot_time_s_) + started_after_boot;

    double boot_uptime = read_boot_uptime();
    facts.uptime_s = boot_uptime < 0 ? 0.0 : std::max(0.0, boot_uptime - started_after_boot);
    return facts;
}

std::string ProcfsProcessTable::decode_tty(int tty_nr) {
    if (tty_nr == 0) return {};

    auto nr = static_cast<unsigned int>(tty_nr);
    unsigned int major = (nr >> 8) & 0xfff;
    unsigned int minor = (nr & 0xff) | ((nr >> 12) & 0xfff00);

    // Unix98 pseudo-terminals span majors 136..143
    if (major >= 136 && major <= 143) {
        return std::format("pts/{}", (major - 136) * 256 + minor);
    }
    if (major == 4) {
        if (minor < 64) return std::format("tty{}", minor);
        return std::format("ttyS{}", minor - 64);
    }
    if (major == 5 && minor == 1) return "console";
    return std::format("{}:{}", major, minor);
}

std::string ProcfsProcessTable::pid_path(int pid, const char* leaf) const {
    return std::format("{}/{}/{}", proc_root_, pid, leaf);
}

std::string ProcfsProcessTable::read_comm(int pid) const {
    std::ifstream f(pid_path(pid, "comm"));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

std::string ProcfsProcessTable::read_argv0(int pid) const {
    std::ifstream f(pid_path(pid, "cmdline"));
    if (!f.is_open()) return {};
    std::string argv0;
    std::getline(f, argv0, '\0');
    return argv0;
}

std::string ProcfsProcessTable::read_cwd(int pid) const {
    std::error_code ec;
    auto path = fs::read_symlink(pid_path(pid, "cwd"), ec);
    if (ec) return {};
    // The kernel marks a removed working directory with this suffix.
    auto cwd = path.string();
    constexpr std::string_view deleted = " (deleted)";
    if (cwd.ends_with(deleted)) cwd.resize(cwd.size() - deleted.size());
    return cwd;
}

double ProcfsProcessTable::read_boot_uptime() const {
    std::ifstream f(proc_root_ + "/uptime");
    double uptime = -1.0;
    if (!(f >> uptime)) return -1.0;
    return uptime;
}

uint64_t ProcfsProcessTable::read_boot_time() const {
    std::ifstream f(proc_root_ + "/stat");
    std::string line;
    while (std::getline(f, line)) {
        if (line.starts_with("btime ")) {
            std::istringstream iss(line.substr(6));
            uint64_t btime = 0;
            iss >> btime;
            return btime;
        }
    }
    return 0;
}
