#pragma once

#include <cstdint>
#include <string>

namespace sqlmcp {

// ============================================================================
// Server Config
// ============================================================================

struct ServerConfig {
    std::string name = "sqlite-manager";
    std::string version = "0.1.0";
};

// ============================================================================
// Transport Config
// ============================================================================

enum class TransportMode {
    STDIO,
    HTTP
};

inline const char* transport_mode_str(TransportMode mode) {
    switch (mode) {
        case TransportMode::STDIO: return "stdio";
        case TransportMode::HTTP:  return "http";
        default: return "unknown";
    }
}

struct TransportConfig {
    std::string mode = "stdio";
    std::string host = "127.0.0.1";
    int64_t port = 8080;                    // Kept wide so out-of-range values reach validation
    std::string endpoint = "/mcp";
    int64_t threads = 4;
    int64_t max_body_bytes = 1048576;

    [[nodiscard]] TransportMode transport_mode() const {
        return mode == "http" ? TransportMode::HTTP : TransportMode::STDIO;
    }
};

// ============================================================================
// Database Config
// ============================================================================

struct DatabaseConfig {
    int64_t busy_timeout_ms = 0;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
    std::string file;                       // Empty = stderr
};

// ============================================================================
// Insights Config
// ============================================================================

struct InsightsConfig {
    int64_t max_entries = 0;                // 0 = unbounded
};

// ============================================================================
// Complete Server Config
// ============================================================================

struct McpServerConfig {
    ServerConfig server;
    TransportConfig transport;
    DatabaseConfig database;
    LoggingConfig logging;
    InsightsConfig insights;
};

} // namespace sqlmcp
