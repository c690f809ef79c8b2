#include "catalog/operation_catalog.hpp"
#include "config/cli_options.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "dispatcher/operation_dispatcher.hpp"
#include "executor/query_executor.hpp"
#include "insight/insight_ledger.hpp"
#include "protocol/mcp_session.hpp"
#include "server/http_transport.hpp"
#include "server/stdio_transport.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>

using namespace sqlmcp;

// Global instances for signal handling
std::shared_ptr<HttpTransport> g_http_transport;
std::shared_ptr<StdioTransport> g_stdio_transport;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    if (g_http_transport) {
        g_http_transport->stop();
        return;
    }
    // stdin reads block; there is nothing left to drain
    std::_Exit(0);
}

int main(int argc, char* argv[]) {
    const auto options = CliOptions::parse(argc, argv);
    if (options.show_help) {
        std::cerr << kUsage << '\n';
        return 0;
    }
    if (!options.success) {
        std::cerr << options.error_message << '\n' << kUsage << '\n';
        return 1;
    }

    try {
        // Configuration
        McpServerConfig config;
        if (!options.config_path.empty()) {
            auto config_result = ConfigLoader::load_from_file(options.config_path);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return 1;
            }
            config = std::move(config_result.config);
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        if (!config.logging.file.empty() && !utils::log::set_file(config.logging.file)) {
            utils::log::warn(std::format("Cannot open log file {}, logging to stderr",
                config.logging.file));
        }
        if (!options.config_path.empty()) {
            utils::log::info(std::format("Configuration loaded from {}", options.config_path));
        }

        // Database
        const std::string db_path = resolve_database_path(options.database_path);
        SqliteConnectionFactory factory(SqliteConnectionFactory::Config{
            .busy_timeout_ms = static_cast<int>(config.database.busy_timeout_ms),
        });
        auto connection = factory.create(db_path);
        if (!connection) {
            utils::log::error(std::format("Fatal: cannot open database {}", db_path));
            return 1;
        }

        // Core
        auto executor = std::make_shared<QueryExecutor>(std::move(connection));
        auto ledger = std::make_shared<InsightLedger>(InsightLedger::Config{
            .max_entries = static_cast<size_t>(config.insights.max_entries),
        });
        auto dispatcher = std::make_shared<OperationDispatcher>(
            OperationCatalog::standard(), executor, ledger);
        auto session = std::make_shared<McpSession>(dispatcher, ServerInfo{
            .name = config.server.name,
            .version = config.server.version,
        });

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        const auto mode = config.transport.transport_mode();
        if (mode == TransportMode::HTTP) {
            g_http_transport = std::make_shared<HttpTransport>(session, config.transport);
        } else {
            g_stdio_transport = std::make_shared<StdioTransport>(session, std::cin, std::cout);
        }

        utils::log::info(std::format("SQLite MCP Server running on {}", transport_mode_str(mode)));
        utils::log::info(std::format("Database path: {}", db_path));

        // Serve (blocking)
        if (g_http_transport) {
            g_http_transport->start();
        } else {
            g_stdio_transport->run();
        }

        const auto stats = dispatcher->get_stats();
        utils::log::info(std::format("Shutting down: {} tool calls, {} rejected",
            stats.total_calls, stats.rejected_calls));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
