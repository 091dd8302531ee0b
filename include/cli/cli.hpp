#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace caskdb::cli {

struct CliOptions {
    std::string file;         // Overrides the config path when set
    std::string config_file;
    bool debug{false};
    bool help{false};
    std::vector<std::string> command;  // Command name followed by its arguments
};

struct ParseResult {
    std::optional<CliOptions> options;
    std::string error;
};

// args excludes the program name
ParseResult parse_cli(const std::vector<std::string>& args);

void print_usage(std::ostream& out, const std::string& program);

/**
 * Execute a parsed command against the store, writing results to out.
 * Returns the process exit code: 0 on success, 1 for an absent key or a
 * storage/config error.
 */
int run_command(const CliOptions& options, std::ostream& out);

} // namespace caskdb::cli
