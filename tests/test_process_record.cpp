#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "process_record.hpp"

#include <algorithm>

TEST_CASE("ProcessRecord", "[process]") {

    SECTION("CommandLineJoinsArgs") {
        auto p = make_process(10, "firefox", 0, {"/usr/lib/firefox/firefox", "-contentproc", "12"});
        REQUIRE(p.command_line() == "/usr/lib/firefox/firefox -contentproc 12");
    }

    SECTION("KernelThreadUsesBracketedName") {
        auto p = make_process(2, "kthreadd", 0);
        REQUIRE(p.command_line() == "[kthreadd]");
    }
}

TEST_CASE("summarize_memory", "[memory]") {

    SECTION("EmptyIsZero") {
        REQUIRE(summarize_memory({}) == 0.0);
    }

    SECTION("ThreeFirefoxProcesses") {
        std::vector<ProcessRecord> procs = {
            make_process(1, "firefox", 204800),
            make_process(2, "firefox", 153600),
            make_process(3, "firefox", 102400),
        };
        REQUIRE(summarize_memory(procs) == 450.0);
    }

    SECTION("OrderIndependent") {
        std::vector<ProcessRecord> procs = {
            make_process(1, "a", 1),
            make_process(2, "b", 1023),
            make_process(3, "c", 333),
            make_process(4, "d", 77777),
        };
        double forward = summarize_memory(procs);
        std::ranges::reverse(procs);
        REQUIRE(summarize_memory(procs) == forward);
        std::ranges::rotate(procs, procs.begin() + 1);
        REQUIRE(summarize_memory(procs) == forward);
    }

    SECTION("SumsKilobytesBeforeDividing") {
        // 1 kB + 1023 kB is exactly 1 MB, not two rounded fractions
        std::vector<ProcessRecord> procs = {make_process(1, "a", 1), make_process(2, "b", 1023)};
        REQUIRE(summarize_memory(procs) == 1.0);
    }
}
