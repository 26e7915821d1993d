#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "platform/linux/procfs_process_table.hpp"

#include <algorithm>
#include <filesystem>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

TEST_CASE("ProcfsProcessTable", "[procfs]") {

    SECTION("ReadsOwnCmdline") {
        ProcfsProcessTable table;
        auto cmd = table.cmdline(getpid());
        REQUIRE_FALSE(cmd.empty());
        REQUIRE(cmd.find("kpb_tests") != std::string::npos);
    }

    SECTION("ParentMatchesGetppid") {
        ProcfsProcessTable table;
        auto ppid = table.parent_pid(getpid());
        REQUIRE(ppid.has_value());
        REQUIRE(*ppid == getppid());
    }

    SECTION("ForkedChildIsListed") {
        pid_t child = fork();
        REQUIRE(child >= 0);

        if (child == 0) {
            sleep(10);
            _exit(0);
        }

        usleep(50000); // 50ms

        ProcfsProcessTable table;
        auto children = table.children(getpid());
        REQUIRE(std::find(children.begin(), children.end(), child) != children.end());
        REQUIRE(table.parent_pid(child) == getpid());

        kill(child, SIGTERM);
        waitpid(child, nullptr, 0);
    }

    SECTION("AllPidsContainsSelf") {
        ProcfsProcessTable table;
        auto pids = table.all_pids();
        REQUIRE(std::find(pids.begin(), pids.end(), getpid()) != pids.end());
        REQUIRE(std::is_sorted(pids.begin(), pids.end()));
    }

    SECTION("MissingProcessReadsEmpty") {
        ProcfsProcessTable table;
        constexpr int gone = 999999999;
        REQUIRE(table.cmdline(gone).empty());
        REQUIRE_FALSE(table.parent_pid(gone).has_value());
        REQUIRE(table.children(gone).empty());

        REQUIRE(table.cmdline(0).empty());
        REQUIRE_FALSE(table.parent_pid(-1).has_value());
    }

    SECTION("FakeRootWithParenthesesInComm") {
        TmpDir root;
        fs::create_directories(root.path / "42");
        fs::create_directories(root.path / "self");
        root.touch("42/stat", "42 (evil) S (name) S 7 42 42 0 -1 4194560\n");
        root.touch("42/cmdline", std::string("kitty\0--single-instance\0", 24));

        ProcfsProcessTable table(root.path.string());
        REQUIRE(table.parent_pid(42) == 7);
        REQUIRE(table.cmdline(42) == "kitty --single-instance");
        REQUIRE(table.all_pids() == std::vector<int>{42});
    }

    SECTION("FakeRootWithTruncatedStat") {
        TmpDir root;
        fs::create_directories(root.path / "43");
        root.touch("43/stat", "43 (kitty");

        ProcfsProcessTable table(root.path.string());
        REQUIRE_FALSE(table.parent_pid(43).has_value());
    }
}
