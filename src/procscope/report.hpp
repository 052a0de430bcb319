#pragma once

#include "config.hpp"
#include "process_record.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Result of one inspection pass. Counts and totals are derived from the
// process list at construction and cannot drift from it afterwards.
class InspectionReport {
public:
    InspectionReport(std::string pattern, std::vector<ProcessRecord> processes,
                     std::optional<int> window_count, std::string window_backend = {});

    const std::string& pattern() const { return pattern_; }
    size_t matched_process_count() const { return processes_.size(); }
    const std::vector<ProcessRecord>& processes() const { return processes_; }
    double total_memory_mb() const { return total_memory_mb_; }

    // nullopt means no window manager could be queried, not zero windows.
    std::optional<int> window_count() const { return window_count_; }
    const std::string& window_backend() const { return window_backend_; }

private:
    std::string pattern_;
    std::vector<ProcessRecord> processes_;
    double total_memory_mb_;
    std::optional<int> window_count_;
    std::string window_backend_;
};

struct ReportOptions {
    int detail_limit = 20;
    int tree_limit = 20;
    int max_args = 4;

    // Descriptive "Expected setup" section; omitted when instances <= 0.
    int expected_instances = 0;
    int expected_tabs_per_instance = 0;
    int expected_total_tabs = 0;

    static ReportOptions from_config(const Config& cfg);
};

std::string render_report(const InspectionReport& report, const ReportOptions& options = {});

nlohmann::json report_to_json(const InspectionReport& report);
