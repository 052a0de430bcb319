#include "cli.hpp"
#include "config.hpp"
#include "inspector.hpp"
#include "platform/fallback_window_query.hpp"
#include "platform/linux/procfs_process_table.hpp"
#include "platform/linux/sway_window_query.hpp"
#include "platform/linux/wmctrl_window_query.hpp"

#include <memory>
#include <print>

static std::unique_ptr<WindowQuery> make_window_query(const std::string& name) {
    if (name == "sway" || name == "i3") return std::make_unique<SwayWindowQuery>();
    if (name == "wmctrl") return std::make_unique<WmctrlWindowQuery>();
    std::println(stderr, "config: unknown window backend '{}', skipped", name);
    return nullptr;
}

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        std::println(stderr, "{}", opts.error());
        print_usage(stderr);
        return 2;
    }
    if (opts->help) {
        print_usage(stdout);
        return 0;
    }

    // Load config
    Config config;
    if (!opts->config_path.empty()) {
        config = Config::load(opts->config_path);
    } else {
        config = Config::load_default();
    }
    if (opts->pattern) config.pattern = *opts->pattern;

    FallbackWindowQuery windows;
    for (const auto& name : config.window.backends) {
        if (auto backend = make_window_query(name)) windows.add(std::move(backend));
    }

    if (opts->verbose) {
        std::println(stderr, "[procscope] Inspecting '{}'", config.pattern);
        if (windows.empty()) std::println(stderr, "[procscope] No window backends configured");
    }

    ProcfsProcessTable table;
    Inspector inspector(table, windows, opts->verbose);
    return run_inspection(inspector, config.pattern, ReportOptions::from_config(config),
                          opts->json, stdout, stderr);
}
