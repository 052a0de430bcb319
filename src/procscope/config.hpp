#pragma once

#include <string>
#include <vector>

struct Config {
    std::string pattern = "firefox";

    struct Report {
        int detail_limit = 20;
        int tree_limit = 20;
        int max_args = 4; // command tokens shown, argv[0] included
    } report;

    // What the test environment is supposed to look like. Printed as-is,
    // nothing is checked against it.
    struct Expected {
        int instances = 3;
        int tabs_per_instance = 4;

        int total_tabs() const { return instances * tabs_per_instance; }
    } expected;

    struct Window {
        std::vector<std::string> backends = {"sway", "wmctrl"};
    } window;

    static Config load(const std::string& path);
    static Config load_default();
};
