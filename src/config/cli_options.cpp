#include "config/cli_options.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <system_error>

namespace sqlmcp {

namespace {

CliOptions usage_error(std::string message) {
    CliOptions options;
    options.success = false;
    options.error_message = std::move(message);
    return options;
}

} // anonymous namespace

CliOptions CliOptions::parse(const std::vector<std::string>& args) {
    CliOptions options;
    std::vector<std::string> positionals;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            options.success = true;
            return options;
        }
        if (arg == "--config") {
            if (i + 1 >= args.size()) {
                return usage_error("--config requires a file argument");
            }
            options.config_path = args[++i];
            continue;
        }
        if (utils::starts_with(arg, "--config=")) {
            options.config_path = arg.substr(9);
            continue;
        }
        if (utils::starts_with(arg, "-") && arg != "-") {
            return usage_error(std::format("Unknown option: {}", arg));
        }
        positionals.push_back(arg);
    }

    if (positionals.size() != 1) {
        return usage_error(std::format("Expected exactly one database path, got {}", positionals.size()));
    }

    options.database_path = std::move(positionals.front());
    options.success = true;
    return options;
}

CliOptions CliOptions::parse(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

std::string resolve_database_path(const std::string& path) {
    if (path == ":memory:") {
        return path;
    }

    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path;
    }
    return absolute.lexically_normal().string();
}

} // namespace sqlmcp
