#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlmcp {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

/// Expand every string leaf under a node, descending into tables and arrays.
void expand_node(toml::node& node) {
    if (auto* str = node.as_string()) {
        *str = expand_env_vars(str->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto& [key, val] : *tbl) expand_node(val);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) expand_node(elem);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_node(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_node(result);
    return result;
}

} // anonymous namespace

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.name = s["name"].value_or("sqlite-manager"s);
    cfg.version = s["version"].value_or("0.1.0"s);
    return cfg;
}

TransportConfig ConfigLoader::extract_transport(const toml::table& root) {
    TransportConfig cfg;
    const auto* transport = root["transport"].as_table();
    if (!transport) return cfg;
    const auto& t = *transport;

    cfg.mode = utils::to_lower(t["mode"].value_or("stdio"s));
    cfg.host = t["host"].value_or("127.0.0.1"s);
    cfg.port = t["port"].value_or(int64_t{8080});
    cfg.endpoint = t["endpoint"].value_or("/mcp"s);
    cfg.threads = t["threads"].value_or(int64_t{4});
    cfg.max_body_bytes = t["max_body_bytes"].value_or(int64_t{1048576});
    return cfg;
}

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;

    cfg.busy_timeout_ms = (*database)["busy_timeout_ms"].value_or(int64_t{0});
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = utils::to_lower(l["level"].value_or("info"s));
    cfg.file = l["file"].value_or(""s);
    return cfg;
}

InsightsConfig ConfigLoader::extract_insights(const toml::table& root) {
    InsightsConfig cfg;
    const auto* insights = root["insights"].as_table();
    if (!insights) return cfg;

    cfg.max_entries = (*insights)["max_entries"].value_or(int64_t{0});
    return cfg;
}

McpServerConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    McpServerConfig config;
    config.server = extract_server(tbl);
    config.transport = extract_transport(tbl);
    config.database = extract_database(tbl);
    config.logging = extract_logging(tbl);
    config.insights = extract_insights(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(McpServerConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed: ";
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) combined += "; ";
            combined += errors[i];
        }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const McpServerConfig& config) {
    std::vector<std::string> errors;

    if (config.server.name.empty()) {
        errors.push_back("server.name must not be empty");
    }

    const auto& transport = config.transport;
    if (transport.mode != "stdio" && transport.mode != "http") {
        errors.push_back(std::format(
            "transport.mode must be \"stdio\" or \"http\", got \"{}\"", transport.mode));
    }
    if (transport.port < 1 || transport.port > 65535) {
        errors.push_back(std::format("transport.port must be 1-65535, got {}", transport.port));
    }
    if (!utils::starts_with(transport.endpoint, "/")) {
        errors.push_back(std::format(
            "transport.endpoint must start with '/', got \"{}\"", transport.endpoint));
    }
    if (transport.threads < 1) {
        errors.push_back(std::format("transport.threads must be >= 1, got {}", transport.threads));
    }
    if (transport.max_body_bytes < 1) {
        errors.push_back(std::format(
            "transport.max_body_bytes must be >= 1, got {}", transport.max_body_bytes));
    }

    if (config.database.busy_timeout_ms < 0) {
        errors.push_back(std::format(
            "database.busy_timeout_ms must be >= 0, got {}", config.database.busy_timeout_ms));
    } else if (config.database.busy_timeout_ms > std::numeric_limits<int>::max()) {
        errors.push_back(std::format("database.busy_timeout_ms must be <= {}, got {}",
            std::numeric_limits<int>::max(), config.database.busy_timeout_ms));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got \"{}\"", config.logging.level));
    }

    if (config.insights.max_entries < 0) {
        errors.push_back(std::format(
            "insights.max_entries must be >= 0, got {}", config.insights.max_entries));
    }

    return errors;
}

} // namespace sqlmcp
