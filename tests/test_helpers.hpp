#pragma once

#include "platform/process_table.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <unistd.h>
#include <vector>

namespace test {

// RAII temp directory that auto-deletes.
struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        auto tmpl = (std::filesystem::temp_directory_path() / "cs_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        path = ::mkdtemp(buf.data());
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        auto file = path / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream(file) << content;
        return file;
    }
};

// In-memory process table. Pids in `vanishing` are listed but gone by the
// time they are inspected.
class FakeProcessTable : public ProcessTable {
public:
    struct Proc {
        ProcessIdentity identity;
        ProcessFacts facts;
    };

    void add(int pid, std::string comm, std::string argv0, std::string cwd = "/work",
             double uptime_s = 60.0, char state = 'S', uint64_t cpu_ticks = 0) {
        Proc p;
        p.identity = {.comm = std::move(comm), .argv0 = std::move(argv0)};
        p.facts.pid = pid;
        p.facts.working_dir = std::move(cwd);
        p.facts.terminal = "pts/1";
        p.facts.state = state;
        p.facts.start_ticks = 1000 + static_cast<uint64_t>(pid);
        p.facts.cpu_ticks = cpu_ticks;
        p.facts.start_epoch_s = 1'700'000'000.0;
        p.facts.uptime_s = uptime_s;
        procs[pid] = std::move(p);
        order.push_back(pid);
    }

    std::expected<std::vector<int>, std::string> list_pids() override {
        ++list_calls;
        if (fail_listing) return std::unexpected(std::string("proc unavailable"));
        return order;
    }

    std::optional<ProcessIdentity> identify(int pid) override {
        auto it = procs.find(pid);
        if (it == procs.end()) return std::nullopt;
        return it->second.identity;
    }

    std::optional<ProcessFacts> inspect(int pid) override {
        ++inspect_calls;
        if (vanishing.contains(pid)) return std::nullopt;
        auto it = procs.find(pid);
        if (it == procs.end()) return std::nullopt;
        return it->second.facts;
    }

    std::map<int, Proc> procs;
    std::vector<int> order;
    std::set<int> vanishing;
    bool fail_listing = false;
    int list_calls = 0;
    int inspect_calls = 0;
};

} // namespace test
