#include <catch2/catch_test_macros.hpp>

#include "wm/window_info.hpp"

TEST_CASE("WindowInfo", "[window]") {

    SECTION("DefaultIsEmpty") {
        WindowInfo info;
        REQUIRE(info.empty());
    }

    SECTION("IdAloneIsEmpty") {
        WindowInfo info;
        info.id = "0x02400003";
        REQUIRE(info.empty());
    }

    SECTION("WithAppIdNotEmpty") {
        WindowInfo info;
        info.app_id = "firefox";
        REQUIRE_FALSE(info.empty());
    }

    SECTION("WithWindowClassNotEmpty") {
        WindowInfo info;
        info.window_class = "Navigator.firefox";
        REQUIRE_FALSE(info.empty());
    }

    SECTION("WithTitleNotEmpty") {
        WindowInfo info;
        info.title = "Mozilla Firefox";
        REQUIRE_FALSE(info.empty());
    }

    SECTION("WithPidNotEmpty") {
        WindowInfo info;
        info.pid = 1234;
        REQUIRE_FALSE(info.empty());
    }
}
