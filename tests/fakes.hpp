#pragma once

#include "platform/process_table.hpp"
#include "platform/window_query.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

struct FakeProcessTable : ProcessTable {
    std::vector<ProcessRecord> records;
    std::optional<std::string> failure;

    std::expected<std::vector<ProcessRecord>, QueryError> snapshot() const override {
        if (failure) return std::unexpected(QueryError{*failure});
        return records;
    }
};

struct FakeWindowQuery : WindowQuery {
    std::string backend = "fake";
    std::optional<std::vector<WindowInfo>> windows;
    int queries = 0;

    std::string name() const override { return backend; }
    std::optional<std::vector<WindowInfo>> list_windows() override {
        ++queries;
        return windows;
    }
};

inline ProcessRecord make_process(int pid, std::string name, uint64_t rss_kb,
                                  std::vector<std::string> args = {}, int ppid = 1) {
    ProcessRecord p;
    p.pid = pid;
    p.ppid = ppid;
    p.command_name = std::move(name);
    p.resident_memory_kb = rss_kb;
    p.command_args = std::move(args);
    return p;
}
