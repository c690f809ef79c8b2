#pragma once

#include <string>
#include <vector>

namespace sqlmcp {

inline constexpr const char* kUsage = "Usage: mcp-server-sqlite [--config <file>] <database-path>";

/**
 * @brief Parsed command line
 *
 * Exactly one positional (the database path) is accepted, plus an optional
 * --config <file>. Anything else is a usage error.
 */
struct CliOptions {
    bool success = false;
    bool show_help = false;
    std::string error_message;
    std::string config_path;            // Empty = built-in defaults
    std::string database_path;          // As given on the command line

    [[nodiscard]] static CliOptions parse(const std::vector<std::string>& args);
    [[nodiscard]] static CliOptions parse(int argc, const char* const* argv);
};

/**
 * @brief Absolute, normalized form of a database path
 *
 * ":memory:" is returned unchanged.
 */
[[nodiscard]] std::string resolve_database_path(const std::string& path);

} // namespace sqlmcp
