#include "cli/cli.hpp"
#include "storage/disk_store.hpp"
#include "storage/store_config.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace caskdb::cli {

namespace {

// Number of arguments each command takes after its name
std::optional<std::size_t> command_arity(const std::string& name) {
    if (name == "set") return 2;
    if (name == "get") return 1;
    if (name == "keys" || name == "stats") return 0;
    return std::nullopt;
}

} // namespace

ParseResult parse_cli(const std::vector<std::string>& args) {
    ParseResult result;
    CliOptions options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--file" && i + 1 < args.size()) {
            options.file = args[++i];
        } else if (arg == "--config" && i + 1 < args.size()) {
            options.config_file = args[++i];
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--help") {
            options.help = true;
        } else {
            options.command.push_back(arg);
        }
    }

    if (options.help) {
        result.options = std::move(options);
        return result;
    }

    if (options.command.empty()) {
        result.error = "No command given";
        return result;
    }

    const auto& name = options.command[0];
    auto arity = command_arity(name);
    if (!arity) {
        result.error = "Unknown command: " + name;
        return result;
    }
    if (options.command.size() != *arity + 1) {
        result.error = name + ": expected " + std::to_string(*arity) + " argument(s)";
        return result;
    }

    result.options = std::move(options);
    return result;
}

void print_usage(std::ostream& out, const std::string& program) {
    out << "CaskDB - BitCask storage engine\n\n"
        << "Usage: " << program << " [options] <command> [args]\n\n"
        << "Options:\n"
        << "  --file <path>       Log file to open (default: data.db)\n"
        << "  --config <file>     JSON store config; --file overrides its path\n"
        << "  --debug             Enable debug logging\n"
        << "  --help              Show this help message\n\n"
        << "Commands:\n"
        << "  set <key> <value>   Store a value\n"
        << "  get <key>           Print the value of a key (exit code 1 if absent)\n"
        << "  keys                List all live keys\n"
        << "  stats               Print store statistics as JSON\n";
}

int run_command(const CliOptions& options, std::ostream& out) {
    try {
        storage::StoreConfig config;
        if (!options.config_file.empty()) {
            config = storage::load_config_file(options.config_file);
        }
        if (!options.file.empty()) {
            config.path = options.file;
        }

        storage::DiskStore store(config);
        const auto& op = options.command.at(0);

        if (op == "set") {
            store.set(options.command[1], options.command[2]);
        } else if (op == "get") {
            auto value = store.get(options.command[1]);
            if (!value) {
                spdlog::warn("Key not found: {}", options.command[1]);
                return 1;
            }
            out << *value << "\n";
        } else if (op == "keys") {
            for (const auto& key : store.keys()) {
                out << key << "\n";
            }
        } else if (op == "stats") {
            out << store.stats().to_json().dump(2) << "\n";
        }

        store.close();

    } catch (const std::exception& e) {
        spdlog::error("CaskDB error: {}", e.what());
        return 1;
    }

    return 0;
}

} // namespace caskdb::cli
