#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct ProcessRecord {
    int pid = 0;
    int ppid = 0;
    std::string command_name;        // /proc/<pid>/comm, e.g. "firefox"
    uint64_t resident_memory_kb = 0; // VmRSS
    std::vector<std::string> command_args;

    // Arguments joined by spaces, or "[name]" for processes without argv
    // (kernel threads), the way ps prints them.
    std::string command_line() const;
};

// Total resident memory in MB. Sums kB first so per-record rounding never
// leaks into the result; 0.0 for no processes.
double summarize_memory(const std::vector<ProcessRecord>& processes);
