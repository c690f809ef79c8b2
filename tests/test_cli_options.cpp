#include <catch2/catch_test_macros.hpp>
#include "config/cli_options.hpp"

#include <filesystem>

using namespace sqlmcp;

TEST_CASE("CliOptions: single database path", "[cli]") {
    const auto options = CliOptions::parse(std::vector<std::string>{"data.db"});
    REQUIRE(options.success);
    REQUIRE_FALSE(options.show_help);
    REQUIRE(options.database_path == "data.db");
    REQUIRE(options.config_path.empty());
}

TEST_CASE("CliOptions: config file", "[cli]") {
    SECTION("Separate argument") {
        const auto options = CliOptions::parse(std::vector<std::string>{"--config", "srv.toml", "data.db"});
        REQUIRE(options.success);
        REQUIRE(options.config_path == "srv.toml");
        REQUIRE(options.database_path == "data.db");
    }

    SECTION("Inline value") {
        const auto options = CliOptions::parse(std::vector<std::string>{"data.db", "--config=srv.toml"});
        REQUIRE(options.success);
        REQUIRE(options.config_path == "srv.toml");
    }

    SECTION("Missing value") {
        const auto options = CliOptions::parse(std::vector<std::string>{"data.db", "--config"});
        REQUIRE_FALSE(options.success);
    }
}

TEST_CASE("CliOptions: wrong positional count", "[cli]") {
    CHECK_FALSE(CliOptions::parse(std::vector<std::string>{}).success);
    CHECK_FALSE(CliOptions::parse(std::vector<std::string>{"a.db", "b.db"}).success);
}

TEST_CASE("CliOptions: unknown option", "[cli]") {
    const auto options = CliOptions::parse(std::vector<std::string>{"--verbose", "data.db"});
    REQUIRE_FALSE(options.success);
    REQUIRE(options.error_message == "Unknown option: --verbose");
}

TEST_CASE("CliOptions: help", "[cli]") {
    const auto options = CliOptions::parse(std::vector<std::string>{"--help"});
    REQUIRE(options.success);
    REQUIRE(options.show_help);
}

TEST_CASE("CliOptions: argv form skips program name", "[cli]") {
    const char* argv[] = {"mcp-server-sqlite", ":memory:"};
    const auto options = CliOptions::parse(2, argv);
    REQUIRE(options.success);
    REQUIRE(options.database_path == ":memory:");
}

TEST_CASE("resolve_database_path", "[cli]") {
    SECTION("In-memory database is untouched") {
        REQUIRE(resolve_database_path(":memory:") == ":memory:");
    }

    SECTION("Relative paths become absolute") {
        const auto resolved = resolve_database_path("dir/../data.db");
        const std::filesystem::path path(resolved);
        REQUIRE(path.is_absolute());
        REQUIRE(path.filename() == "data.db");
        REQUIRE(resolved.find("..") == std::string::npos);
    }

    SECTION("Absolute paths are kept") {
        REQUIRE(resolve_database_path("/var/db/app.db") == "/var/db/app.db");
    }
}
