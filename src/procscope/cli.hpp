#pragma once

#include "inspector.hpp"
#include "report.hpp"

#include <cstdio>
#include <expected>
#include <optional>
#include <string>

struct CliOptions {
    std::optional<std::string> pattern;
    std::string config_path;
    bool json = false;
    bool verbose = false;
    bool help = false;
};

std::expected<CliOptions, std::string> parse_args(int argc, const char* const argv[]);

void print_usage(std::FILE* stream);

// Run one inspection and print it to `out`. Returns the process exit code:
// 0 on success, 1 if the process table could not be read (nothing is
// written to `out` in that case).
int run_inspection(Inspector& inspector, const std::string& pattern,
                   const ReportOptions& options, bool json,
                   std::FILE* out, std::FILE* err);
