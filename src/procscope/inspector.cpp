#include "inspector.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <print>

Inspector::Inspector(ProcessTable& table, WindowQuery& windows, bool verbose, int self_pid)
    : table_(table), windows_(windows), verbose_(verbose), self_pid_(self_pid) {}

std::expected<std::vector<ProcessRecord>, QueryError>
Inspector::list_processes(const std::string& pattern) const {
    auto all = table_.snapshot();
    if (!all) return std::unexpected(all.error());

    log(std::format("process table: {} entries", all->size()));

    std::vector<ProcessRecord> matched;
    for (auto& p : *all) {
        if (p.pid == self_pid_) continue;
        if (!contains_ignore_case(p.command_line(), pattern)) continue;
        matched.push_back(std::move(p));
    }

    std::ranges::sort(matched, {}, &ProcessRecord::pid);
    return matched;
}

std::optional<int> Inspector::count_windows(const std::string& pattern) {
    auto windows = windows_.list_windows();
    if (!windows) {
        log("window query: unavailable");
        return std::nullopt;
    }

    log(std::format("window query: {} windows via {}", windows->size(), windows_.name()));

    auto count = std::ranges::count_if(*windows, [&](const WindowInfo& w) {
        return contains_ignore_case(w.app_id, pattern) ||
               contains_ignore_case(w.window_class, pattern) ||
               contains_ignore_case(w.title, pattern);
    });
    return static_cast<int>(count);
}

std::expected<InspectionReport, QueryError> Inspector::inspect(const std::string& pattern) {
    auto processes = list_processes(pattern);
    if (!processes) return std::unexpected(processes.error());

    log(std::format("matched {} processes for '{}'", processes->size(), pattern));

    auto windows = count_windows(pattern);
    std::string backend = windows ? windows_.name() : std::string{};
    return InspectionReport(pattern, std::move(*processes), windows, std::move(backend));
}

bool Inspector::contains_ignore_case(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    auto it = std::ranges::search(haystack, needle, [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
    return !it.empty();
}

void Inspector::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[procscope] {}", msg);
    }
}
