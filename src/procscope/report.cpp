#include "report.hpp"

#include "process_tree.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <string_view>

namespace {

constexpr std::string_view RULE = "==================================";

void section(std::string& out, std::string_view title) {
    if (!out.empty()) out += '\n';
    std::format_to(std::back_inserter(out), "{}\n{}\n{}\n", RULE, title, RULE);
}

std::string short_command(const ProcessRecord& p, int max_args) {
    if (p.command_args.empty()) return p.command_line();

    std::string line = p.command_args.front();
    size_t shown = std::min(p.command_args.size(), static_cast<size_t>(std::max(max_args, 0)));
    for (size_t i = 1; i < shown; ++i) {
        line += ' ';
        line += p.command_args[i];
    }
    return line;
}

} // namespace

InspectionReport::InspectionReport(std::string pattern, std::vector<ProcessRecord> processes,
                                   std::optional<int> window_count, std::string window_backend)
    : pattern_(std::move(pattern)), processes_(std::move(processes)),
      total_memory_mb_(summarize_memory(processes_)),
      window_count_(window_count), window_backend_(std::move(window_backend)) {}

ReportOptions ReportOptions::from_config(const Config& cfg) {
    ReportOptions opts;
    opts.detail_limit = cfg.report.detail_limit;
    opts.tree_limit = cfg.report.tree_limit;
    opts.max_args = cfg.report.max_args;
    opts.expected_instances = cfg.expected.instances;
    opts.expected_tabs_per_instance = cfg.expected.tabs_per_instance;
    opts.expected_total_tabs = cfg.expected.total_tabs();
    return opts;
}

std::string render_report(const InspectionReport& report, const ReportOptions& options) {
    std::string out;
    auto emit = [&out]<typename... Args>(std::format_string<Args...> fmt, Args&&... args) {
        std::format_to(std::back_inserter(out), fmt, std::forward<Args>(args)...);
        out += '\n';
    };

    section(out, "Process count");
    emit("Pattern: {}", report.pattern());
    emit("Total matching processes: {}", report.matched_process_count());

    section(out, "Detailed processes");
    const auto& procs = report.processes();
    if (procs.empty()) {
        emit("(none)");
    } else {
        size_t limit = static_cast<size_t>(std::max(options.detail_limit, 0));
        emit("{:>7} {:>10}  {}", "PID", "RSS kB", "COMMAND");
        for (size_t i = 0; i < procs.size() && i < limit; ++i) {
            emit("{:>7} {:>10}  {}", procs[i].pid, procs[i].resident_memory_kb,
                 short_command(procs[i], options.max_args));
        }
        if (procs.size() > limit) emit("... {} more", procs.size() - limit);
    }

    section(out, "Process tree");
    auto tree = build_process_tree(procs);
    if (tree.empty()) {
        emit("(none)");
    } else {
        size_t limit = static_cast<size_t>(std::max(options.tree_limit, 0));
        for (size_t i = 0; i < tree.size() && i < limit; ++i) {
            const auto& line = tree[i];
            emit("{}{}({})", std::string(static_cast<size_t>(line.depth) * 2, ' '),
                 line.process->command_name, line.process->pid);
        }
        if (tree.size() > limit) emit("... {} more", tree.size() - limit);
    }

    section(out, "Memory usage");
    emit("Total Memory: {:.1f} MB", report.total_memory_mb());

    section(out, "Window count");
    if (auto count = report.window_count()) {
        emit("Matching windows: {} (via {})", *count, report.window_backend());
    } else {
        emit("Matching windows: unavailable");
    }

    if (options.expected_instances > 0) {
        section(out, "Expected setup");
        emit("Instances: {}", options.expected_instances);
        emit("Tabs per instance: {} ({} total)", options.expected_tabs_per_instance,
             options.expected_total_tabs);
    }

    return out;
}

nlohmann::json report_to_json(const InspectionReport& report) {
    nlohmann::json procs = nlohmann::json::array();
    for (const auto& p : report.processes()) {
        procs.push_back({
            {"pid", p.pid},
            {"ppid", p.ppid},
            {"command_name", p.command_name},
            {"resident_memory_kb", p.resident_memory_kb},
            {"command_args", p.command_args},
        });
    }

    nlohmann::json j = {
        {"pattern", report.pattern()},
        {"matched_process_count", report.matched_process_count()},
        {"processes", procs},
        {"total_memory_mb", report.total_memory_mb()},
        {"window_count", nullptr},
        {"window_backend", nullptr},
    };
    if (auto count = report.window_count()) {
        j["window_count"] = *count;
        j["window_backend"] = report.window_backend();
    }
    return j;
}
