#include "platform/linux/procfs_process_table.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

ProcfsProcessTable::ProcfsProcessTable(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

std::expected<std::vector<ProcessRecord>, QueryError> ProcfsProcessTable::snapshot() const {
    std::error_code ec;
    fs::directory_iterator it(proc_root_, ec);
    if (ec) {
        return std::unexpected(QueryError{
            std::format("cannot read process table {}: {}", proc_root_, ec.message())});
    }

    std::vector<ProcessRecord> records;
    for (const auto& entry : it) {
        auto pid = parse_pid(entry.path().filename().string());
        if (!pid) continue;

        auto record = read_status(*pid);
        if (!record) continue; // exited while we were walking

        record->command_args = read_cmdline(*pid);
        records.push_back(std::move(*record));
    }

    std::ranges::sort(records, {}, &ProcessRecord::pid);
    return records;
}

std::optional<ProcessRecord> ProcfsProcessTable::read_status(int pid) const {
    std::ifstream f(std::format("{}/{}/status", proc_root_, pid));
    if (!f.is_open()) return std::nullopt;

    ProcessRecord record;
    record.pid = pid;

    bool have_name = false;
    std::string line;
    while (std::getline(f, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        auto key = std::string_view(line).substr(0, colon);
        std::istringstream value(line.substr(colon + 1));

        if (key == "Name") {
            std::getline(value >> std::ws, record.command_name);
            have_name = true;
        } else if (key == "PPid") {
            value >> record.ppid;
        } else if (key == "VmRSS") {
            value >> record.resident_memory_kb; // always reported in kB
        }
    }

    if (!have_name) return std::nullopt;
    return record;
}

std::vector<std::string> ProcfsProcessTable::read_cmdline(int pid) const {
    std::ifstream f(std::format("{}/{}/cmdline", proc_root_, pid), std::ios::binary);
    if (!f.is_open()) return {};

    std::string raw(std::istreambuf_iterator<char>(f), {});

    std::vector<std::string> args;
    size_t start = 0;
    while (start < raw.size()) {
        auto end = raw.find('\0', start);
        if (end == std::string::npos) end = raw.size();
        if (end > start) args.emplace_back(raw, start, end - start);
        start = end + 1;
    }
    return args;
}

std::optional<int> ProcfsProcessTable::parse_pid(const std::string& name) {
    int pid = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
    if (ec != std::errc() || ptr != name.data() + name.size() || pid <= 0) return std::nullopt;
    return pid;
}
