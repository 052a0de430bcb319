#pragma once

#include "platform/process_table.hpp"

#include <optional>
#include <string>
#include <vector>

class ProcfsProcessTable : public ProcessTable {
public:
    explicit ProcfsProcessTable(std::string proc_root = "/proc");

    std::expected<std::vector<ProcessRecord>, QueryError> snapshot() const override;

private:
    // Parse /proc/{pid}/status into name, ppid and VmRSS. Returns nullopt
    // if the process is gone.
    std::optional<ProcessRecord> read_status(int pid) const;

    // Read /proc/{pid}/cmdline (NUL separated), empty for kernel threads.
    std::vector<std::string> read_cmdline(int pid) const;

    static std::optional<int> parse_pid(const std::string& name);

    std::string proc_root_;
};
