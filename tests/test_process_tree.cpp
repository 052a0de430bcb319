#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "process_tree.hpp"

TEST_CASE("build_process_tree", "[tree]") {

    SECTION("Empty") {
        REQUIRE(build_process_tree({}).empty());
    }

    SECTION("ParentsBeforeChildren") {
        std::vector<ProcessRecord> procs = {
            make_process(120, "Web Content", 0, {}, 100),
            make_process(100, "firefox", 0, {}, 1),
            make_process(110, "Socket Process", 0, {}, 100),
            make_process(121, "Web Content", 0, {}, 120),
            make_process(300, "firefox", 0, {}, 1),
        };

        auto tree = build_process_tree(procs);
        REQUIRE(tree.size() == 5);

        REQUIRE(tree[0].process->pid == 100);
        REQUIRE(tree[0].depth == 0);
        REQUIRE(tree[1].process->pid == 110);
        REQUIRE(tree[1].depth == 1);
        REQUIRE(tree[2].process->pid == 120);
        REQUIRE(tree[2].depth == 1);
        REQUIRE(tree[3].process->pid == 121);
        REQUIRE(tree[3].depth == 2);
        REQUIRE(tree[4].process->pid == 300);
        REQUIRE(tree[4].depth == 0);
    }

    SECTION("UnmatchedParentMakesRoot") {
        // parent 50 is a shell that was filtered out
        std::vector<ProcessRecord> procs = {
            make_process(60, "firefox", 0, {}, 50),
            make_process(61, "firefox", 0, {}, 50),
        };

        auto tree = build_process_tree(procs);
        REQUIRE(tree.size() == 2);
        REQUIRE(tree[0].depth == 0);
        REQUIRE(tree[1].depth == 0);
    }

    SECTION("ParentCycleStillListsEveryProcessOnce") {
        std::vector<ProcessRecord> procs = {
            make_process(1, "a", 0, {}, 2),
            make_process(2, "b", 0, {}, 1),
        };

        auto tree = build_process_tree(procs);
        REQUIRE(tree.size() == 2);
        REQUIRE(tree[0].process->pid == 1);
        REQUIRE(tree[0].depth == 0);
        REQUIRE(tree[1].process->pid == 2);
        REQUIRE(tree[1].depth == 1);
    }
}
