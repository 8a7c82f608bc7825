#include <catch2/catch.hpp>

#include "platform/linux/procfs_process_table.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace {

std::string self_comm() {
    std::ifstream f("/proc/self/comm");
    std::string comm;
    std::getline(f, comm);
    return comm;
}

} // namespace

TEST_CASE("ProcfsProcessTable on the live system", "[procfs]") {
    ProcfsProcessTable table;

    SECTION("ListsSelf") {
        auto pids = table.list_pids();
        REQUIRE(pids);
        REQUIRE(std::ranges::find(*pids, getpid()) != pids->end());
    }

    SECTION("IdentifiesSelf") {
        auto id = table.identify(getpid());
        REQUIRE(id);
        REQUIRE(id->comm == self_comm());
        REQUIRE_FALSE(id->argv0.empty());
    }

    SECTION("InspectsSelf") {
        auto facts = table.inspect(getpid());
        REQUIRE(facts);
        REQUIRE(facts->pid == getpid());
        REQUIRE(facts->working_dir == std::filesystem::current_path().string());
        REQUIRE(facts->uptime_s >= 0.0);
        REQUIRE(facts->start_epoch_s > 0.0);
    }

    SECTION("UptimeNonDecreasing") {
        auto first = table.inspect(getpid());
        usleep(20000);
        auto second = table.inspect(getpid());
        REQUIRE(first);
        REQUIRE(second);
        REQUIRE(second->uptime_s >= first->uptime_s);
        REQUIRE(second->start_ticks == first->start_ticks);
    }

    SECTION("InvalidPidIsNullopt") {
        REQUIRE_FALSE(table.identify(0));
        REQUIRE_FALSE(table.inspect(-1));
    }
}

TEST_CASE("ProcfsProcessTable on a synthetic tree", "[procfs]") {
    test::TmpDir root;
    auto work = root.path / "work dir";
    std::filesystem::create_directories(work);

    root.write("uptime", "1000.50 2000.00\n");
    root.write("stat", "cpu  1 2 3 4\nbtime 1700000000\nprocesses 99\n");
    root.write("4242/stat",
               "4242 (my (odd) proc) S 1 4242 4242 34819 4242 4194304 10 0 0 0 250 50 0 0 "
               "20 0 1 0 5000 1000 100 0\n");
    root.write("4242/comm", "my (odd) proc\n");
    root.write("4242/cmdline", std::string("/usr/local/bin/claude\0--verbose\0", 32));
    std::filesystem::create_directory_symlink(work, root.path / "4242" / "cwd");

    root.write("777/stat", "777 (ghost) S 1 777 777 0 777 0 0 0 0 0 0 0 0 0 20 0 1 0 10 0 0 0\n");
    root.write("self-not-a-pid/stat", "x");

    ProcfsProcessTable table(root.path.string());

    SECTION("OnlyNumericEntries") {
        auto pids = table.list_pids();
        REQUIRE(pids);
        std::ranges::sort(*pids);
        REQUIRE(*pids == std::vector<int>{777, 4242});
    }

    SECTION("IdentityFromCommAndCmdline") {
        auto id = table.identify(4242);
        REQUIRE(id);
        REQUIRE(id->comm == "my (odd) proc");
        REQUIRE(id->argv0 == "/usr/local/bin/claude");
    }

    SECTION("StatFieldsAfterParenthesizedComm") {
        auto facts = table.inspect(4242);
        REQUIRE(facts);
        REQUIRE(facts->state == 'S');
        REQUIRE(facts->terminal == "pts/3");
        REQUIRE(facts->cpu_ticks == 300);
        REQUIRE(facts->start_ticks == 5000);
        REQUIRE(facts->working_dir == work.string());

        double hz = static_cast<double>(sysconf(_SC_CLK_TCK));
        REQUIRE_THAT(facts->uptime_s, Catch::Matchers::WithinAbs(std::max(0.0, 1000.5 - 5000 / hz), 1e-6));
        REQUIRE_THAT(facts->start_epoch_s, Catch::Matchers::WithinAbs(1700000000.0 + 5000 / hz, 1e-6));
    }

    SECTION("DeletedCwdSuffixStripped") {
        root.write("555/stat", "555 (claude) S 1 555 555 0 555 0 0 0 0 0 0 0 0 0 20 0 1 0 10 0 0 0\n");
        std::filesystem::create_symlink("/tmp/gone-project (deleted)", root.path / "555" / "cwd");
        auto facts = table.inspect(555);
        REQUIRE(facts);
        REQUIRE(facts->working_dir == "/tmp/gone-project");
    }

    SECTION("MissingCwdIsSkipped") {
        REQUIRE_FALSE(table.inspect(777));
    }

    SECTION("MissingProcessIsSkipped") {
        REQUIRE_FALSE(table.identify(9999));
        REQUIRE_FALSE(table.inspect(9999));
    }

    SECTION("MissingRootIsError") {
        ProcfsProcessTable missing((root.path / "nope").string());
        REQUIRE_FALSE(missing.list_pids());
    }
}

TEST_CASE("ProcfsProcessTable tty decoding", "[procfs]") {
    REQUIRE(ProcfsProcessTable::decode_tty(0).empty());
    REQUIRE(ProcfsProcessTable::decode_tty((136 << 8) | 3) == "pts/3");
    REQUIRE(ProcfsProcessTable::decode_tty((137 << 8) | 44) == "pts/300");
    REQUIRE(ProcfsProcessTable::decode_tty((4 << 8) | 2) == "tty2");
    REQUIRE(ProcfsProcessTable::decode_tty((4 << 8) | 64) == "ttyS0");
    REQUIRE(ProcfsProcessTable::decode_tty((5 << 8) | 1) == "console");
}
