#include "cli.hpp"

#include <print>

std::expected<CliOptions, std::string> parse_args(int argc, const char* const argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--pattern" || arg == "-p") {
            if (i + 1 >= argc) return std::unexpected(arg + " needs a value");
            opts.pattern = argv[++i];
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) return std::unexpected(arg + " needs a value");
            opts.config_path = argv[++i];
        } else if (arg == "--json" || arg == "-j") {
            opts.json = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            return std::unexpected("unknown option: " + arg);
        }
    }

    return opts;
}

void print_usage(std::FILE* stream) {
    std::println(stream, "Usage: procscope [options]");
    std::println(stream, "Count processes and windows matching a name and sum their memory.");
    std::println(stream, "Options:");
    std::println(stream, "  -p, --pattern NAME  Process/window name to match (default: firefox)");
    std::println(stream, "  -j, --json          Print the report as JSON");
    std::println(stream, "  -c, --config PATH   Config file path");
    std::println(stream, "  -v, --verbose       Enable verbose logging");
    std::println(stream, "  -h, --help          Show this help");
}

int run_inspection(Inspector& inspector, const std::string& pattern,
                   const ReportOptions& options, bool json,
                   std::FILE* out, std::FILE* err) {
    auto report = inspector.inspect(pattern);
    if (!report) {
        std::println(err, "error: process table query failed: {}", report.error().message);
        return 1;
    }

    if (json) {
        std::println(out, "{}", report_to_json(*report).dump(2));
    } else {
        std::print(out, "{}", render_report(*report, options));
    }
    std::fflush(out);
    return 0;
}
