#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("pattern")) cfg.pattern = j["pattern"].get<std::string>();

        if (j.contains("report")) {
            auto& r = j["report"];
            if (r.contains("detail_limit")) cfg.report.detail_limit = r["detail_limit"].get<int>();
            if (r.contains("tree_limit")) cfg.report.tree_limit = r["tree_limit"].get<int>();
            if (r.contains("max_args")) cfg.report.max_args = r["max_args"].get<int>();
        }

        if (j.contains("expected")) {
            auto& e = j["expected"];
            if (e.contains("instances")) cfg.expected.instances = e["instances"].get<int>();
            if (e.contains("tabs_per_instance"))
                cfg.expected.tabs_per_instance = e["tabs_per_instance"].get<int>();
        }

        if (j.contains("window")) {
            auto& w = j["window"];
            if (w.contains("backends"))
                cfg.window.backends = w["backends"].get<std::vector<std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
