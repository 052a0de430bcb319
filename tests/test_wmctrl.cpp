#include <catch2/catch_test_macros.hpp>

#include "platform/linux/wmctrl_window_query.hpp"
#include "wm/wmctrl_list.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Executable shell script standing in for wmctrl.
struct FakeWmctrl {
    fs::path path;

    explicit FakeWmctrl(const std::string& body) {
        path = fs::temp_directory_path() / ("ps_test_wmctrl_" + std::to_string(getpid()));
        std::ofstream(path) << "#!/bin/sh\n" << body;
        fs::permissions(path, fs::perms::owner_all);
    }

    ~FakeWmctrl() { fs::remove(path); }
};

} // namespace

TEST_CASE("parse_wmctrl_list", "[wmctrl]") {

    SECTION("ParsesFields") {
        auto windows = parse_wmctrl_list(
            "0x02400003  0 Navigator.firefox     devbox Mozilla Firefox - New Tab\n"
            "0x03a00007 -1 xfce4-panel.Xfce4-panel  devbox xfce4-panel\n");

        REQUIRE(windows.size() == 2);
        REQUIRE(windows[0].id == "0x02400003");
        REQUIRE(windows[0].window_class == "Navigator.firefox");
        REQUIRE(windows[0].title == "Mozilla Firefox - New Tab");
        REQUIRE(windows[1].window_class == "xfce4-panel.Xfce4-panel");
        REQUIRE(windows[1].title == "xfce4-panel");
    }

    SECTION("UntitledWindow") {
        auto windows = parse_wmctrl_list("0x01000001  0 N/A  devbox\n");
        REQUIRE(windows.size() == 1);
        REQUIRE(windows[0].window_class == "N/A");
        REQUIRE(windows[0].title.empty());
    }

    SECTION("SkipsShortLines") {
        auto windows = parse_wmctrl_list("\ngarbage\n0x1 0\n");
        REQUIRE(windows.empty());
    }

    SECTION("EmptyOutput") {
        REQUIRE(parse_wmctrl_list("").empty());
    }
}

TEST_CASE("WmctrlWindowQuery", "[wmctrl]") {

    SECTION("RunsProgramAndParses") {
        FakeWmctrl fake(
            "[ \"$1\" = \"-lx\" ] || exit 3\n"
            "echo '0x02400003  0 Navigator.firefox  devbox Mozilla Firefox'\n"
            "echo '0x02600003  0 Navigator.firefox  devbox GitHub - Mozilla Firefox'\n");

        WmctrlWindowQuery query(fake.path.string());
        auto windows = query.list_windows();
        REQUIRE(windows.has_value());
        REQUIRE(windows->size() == 2);
        REQUIRE((*windows)[1].title == "GitHub - Mozilla Firefox");
    }

    SECTION("FailureIsUnavailable") {
        FakeWmctrl fake("echo 'Cannot open display.' >&2\nexit 1\n");

        WmctrlWindowQuery query(fake.path.string());
        REQUIRE_FALSE(query.list_windows().has_value());
    }

    SECTION("MissingProgramIsUnavailable") {
        WmctrlWindowQuery query("procscope-test-no-such-wmctrl");
        REQUIRE_FALSE(query.list_windows().has_value());
    }

    SECTION("MissingPathIsUnavailable") {
        WmctrlWindowQuery query("/nonexistent/bin/wmctrl");
        REQUIRE_FALSE(query.list_windows().has_value());
    }
}
