#include "process_record.hpp"

std::string ProcessRecord::command_line() const {
    if (command_args.empty()) return "[" + command_name + "]";

    std::string line;
    for (const auto& arg : command_args) {
        if (!line.empty()) line += ' ';
        line += arg;
    }
    return line;
}

double summarize_memory(const std::vector<ProcessRecord>& processes) {
    uint64_t total_kb = 0;
    for (const auto& p : processes) total_kb += p.resident_memory_kb;
    return static_cast<double>(total_kb) / 1024.0;
}
