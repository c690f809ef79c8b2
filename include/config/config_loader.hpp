#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace sqlmcp {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        McpServerConfig config;

        static LoadResult ok(McpServerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the server TOML file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a config for invalid values
     * @return One message per violation (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const McpServerConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static TransportConfig extract_transport(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static InsightsConfig extract_insights(const toml::table& root);

    static McpServerConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(McpServerConfig config);
};

} // namespace sqlmcp
