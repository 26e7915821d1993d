#include <catch2/catch_test_macros.hpp>

#include "discovery/process_introspector.hpp"
#include "fakes.hpp"

TEST_CASE("ProcessIntrospector", "[introspector]") {
    FakeProcessTable table;
    table.add(100, 1, "/usr/bin/kitty --single-instance");
    table.add(200, 300, "/usr/local/bin/kitty-pane-bg set-background");
    table.add(300, 100, "-bash");
    table.add(400, 0, "/sbin/init");

    ProcessIntrospector introspector(table, "kitty", "kitty-pane-bg");

    SECTION("MatchesTargetSignature") {
        REQUIRE(introspector.matches(100));
    }

    SECTION("ExcludesOwnBinary") {
        REQUIRE_FALSE(introspector.matches(200));
    }

    SECTION("NonMatchingAndMissingProcesses") {
        REQUIRE_FALSE(introspector.matches(300));
        REQUIRE_FALSE(introspector.matches(400));
        REQUIRE_FALSE(introspector.matches(999));
        REQUIRE_FALSE(introspector.matches(0));
        REQUIRE_FALSE(introspector.matches(-5));
    }

    SECTION("EmptySelfNameDisablesExclusion") {
        ProcessIntrospector loose(table, "kitty", "");
        REQUIRE(loose.matches(200));
    }

    SECTION("ParentLookup") {
        REQUIRE(introspector.parent(300) == 100);
        REQUIRE(introspector.parent(200) == 300);
    }

    SECTION("RootParentsAreAbsent") {
        REQUIRE_FALSE(introspector.parent(100).has_value()); // ppid 1
        REQUIRE_FALSE(introspector.parent(400).has_value()); // ppid 0
        REQUIRE_FALSE(introspector.parent(1).has_value());
        REQUIRE_FALSE(introspector.parent(999).has_value()); // exited
    }

    SECTION("ProcessExitsBetweenQueries") {
        REQUIRE(introspector.matches(100));
        table.remove(100);
        REQUIRE_FALSE(introspector.matches(100));
        REQUIRE_FALSE(introspector.parent(100).has_value());
    }

    SECTION("Children") {
        REQUIRE(introspector.has_children(100));
        REQUIRE(introspector.has_children(300));
        REQUIRE_FALSE(introspector.has_children(200));
        REQUIRE_FALSE(introspector.has_children(999));
    }

    SECTION("FindMatching") {
        table.add(500, 1, "kitty");
        REQUIRE(introspector.find_matching() == std::vector<int>{100, 500});
    }
}
