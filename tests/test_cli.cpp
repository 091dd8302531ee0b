#include <catch2/catch.hpp>
#include "cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace caskdb::cli;

TEST_CASE("CLI argument parsing", "[cli]") {
    SECTION("Options and command") {
        auto parsed = parse_cli({"--file", "books.db", "--debug", "set", "othello", "shakespeare"});

        REQUIRE(parsed.options.has_value());
        REQUIRE(parsed.options->file == "books.db");
        REQUIRE(parsed.options->debug);
        REQUIRE(!parsed.options->help);

        std::vector<std::string> expected = {"set", "othello", "shakespeare"};
        REQUIRE(parsed.options->command == expected);
    }

    SECTION("Options may follow the command") {
        auto parsed = parse_cli({"get", "othello", "--config", "store.json"});

        REQUIRE(parsed.options.has_value());
        REQUIRE(parsed.options->config_file == "store.json");
        REQUIRE(parsed.options->command.size() == 2);
    }

    SECTION("Help needs no command") {
        auto parsed = parse_cli({"--help"});
        REQUIRE(parsed.options.has_value());
        REQUIRE(parsed.options->help);
    }

    SECTION("Missing command") {
        auto parsed = parse_cli({"--file", "books.db"});
        REQUIRE(!parsed.options.has_value());
        REQUIRE(!parsed.error.empty());
    }

    SECTION("Unknown command") {
        auto parsed = parse_cli({"delete", "key"});
        REQUIRE(!parsed.options.has_value());
        REQUIRE(parsed.error == "Unknown command: delete");
    }

    SECTION("Wrong argument count") {
        REQUIRE(!parse_cli({"set", "key"}).options.has_value());
        REQUIRE(!parse_cli({"get"}).options.has_value());
        REQUIRE(!parse_cli({"keys", "extra"}).options.has_value());
    }
}

TEST_CASE("CLI commands", "[cli]") {
    const auto test_file = std::filesystem::temp_directory_path() / "caskdb_test_cli.db";
    const auto config_file = std::filesystem::temp_directory_path() / "caskdb_test_cli.json";
    std::filesystem::remove(test_file);
    std::filesystem::remove(config_file);

    auto run = [](const std::vector<std::string>& args, std::string& output) {
        auto parsed = parse_cli(args);
        REQUIRE(parsed.options.has_value());

        std::ostringstream out;
        int code = run_command(*parsed.options, out);
        output = out.str();
        return code;
    };

    std::string output;

    SECTION("Set then get") {
        REQUIRE(run({"--file", test_file.string(), "set", "othello", "shakespeare"}, output) == 0);
        REQUIRE(output.empty());

        REQUIRE(run({"--file", test_file.string(), "get", "othello"}, output) == 0);
        REQUIRE(output == "shakespeare\n");
    }

    SECTION("Absent key exits with 1") {
        REQUIRE(run({"--file", test_file.string(), "get", "missing"}, output) == 1);
        REQUIRE(output.empty());
    }

    SECTION("Keys and stats") {
        run({"--file", test_file.string(), "set", "b", "2"}, output);
        run({"--file", test_file.string(), "set", "a", "1"}, output);
        run({"--file", test_file.string(), "set", "a", "3"}, output);

        REQUIRE(run({"--file", test_file.string(), "keys"}, output) == 0);
        REQUIRE(output == "a\nb\n");

        REQUIRE(run({"--file", test_file.string(), "stats"}, output) == 0);
        auto stats = nlohmann::json::parse(output);
        REQUIRE(stats["keydir"]["live_keys"] == 2);
        REQUIRE(stats["keydir"]["records_loaded"] == 3);
    }

    SECTION("Path from config file") {
        {
            std::ofstream out(config_file);
            out << nlohmann::json{{"path", test_file.string()}}.dump();
        }

        REQUIRE(run({"--config", config_file.string(), "set", "key", "value"}, output) == 0);
        REQUIRE(std::filesystem::exists(test_file));
        REQUIRE(run({"--file", test_file.string(), "get", "key"}, output) == 0);
        REQUIRE(output == "value\n");
    }

    SECTION("Corrupt log exits with 1") {
        {
            std::ofstream out(test_file, std::ios::binary);
            out << "short";
        }

        REQUIRE(run({"--file", test_file.string(), "keys"}, output) == 1);
    }

    std::filesystem::remove(test_file);
    std::filesystem::remove(config_file);
}
