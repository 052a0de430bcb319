#pragma once

#include "platform/process_table.hpp"
#include "platform/window_query.hpp"
#include "report.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

class Inspector {
public:
    Inspector(ProcessTable& table, WindowQuery& windows, bool verbose = false,
              int self_pid = ::getpid());

    // Processes whose command line contains `pattern`, ignoring case,
    // sorted by pid. Never includes this process.
    std::expected<std::vector<ProcessRecord>, QueryError>
        list_processes(const std::string& pattern) const;

    // Number of windows whose app id, class or title contains `pattern`,
    // or nullopt when no window manager answered.
    std::optional<int> count_windows(const std::string& pattern);

    // list -> summarize -> count windows, in that order.
    std::expected<InspectionReport, QueryError> inspect(const std::string& pattern);

    static bool contains_ignore_case(std::string_view haystack, std::string_view needle);

private:
    void log(const std::string& msg) const;

    ProcessTable& table_;
    WindowQuery& windows_;
    bool verbose_;
    int self_pid_;
};
