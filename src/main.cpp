#include "cli/cli.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] %v");

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = caskdb::cli::parse_cli(args);

    if (!parsed.options) {
        spdlog::error("{}", parsed.error);
        caskdb::cli::print_usage(std::cerr, argv[0]);
        return 2;
    }

    if (parsed.options->help) {
        caskdb::cli::print_usage(std::cout, argv[0]);
        return 0;
    }

    if (parsed.options->debug) {
        spdlog::set_level(spdlog::level::debug);
    }

    return caskdb::cli::run_command(*parsed.options, std::cout);
}
