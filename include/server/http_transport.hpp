#pragma once

#include "config/config_types.hpp"
#include "protocol/mcp_session.hpp"

#include <memory>
#include <string>
#include <string_view>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace sqlmcp {

/**
 * @brief JSON-RPC over HTTP POST, served by cpp-httplib
 *
 * Routes:
 *   POST <endpoint>  JSON-RPC message or batch; 200 with the reply, or 202
 *                    with an empty body when nothing is due
 *   GET  /health     {"status":"ok"}
 */
class HttpTransport {
public:
    HttpTransport(std::shared_ptr<McpSession> session, const TransportConfig& config);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    /**
     * @brief Bind and serve until stop() (blocking)
     * @throws std::runtime_error if the listener cannot be bound
     */
    void start();

    /// Safe to call from another thread or a signal handler.
    void stop();

    struct Reply {
        int status;
        std::string body;
    };

    /**
     * @brief Map one POSTed body to an HTTP reply
     */
    [[nodiscard]] Reply handle_body(std::string_view body);

private:
    void register_routes(httplib::Server& svr);
    void handle_rpc(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<McpSession> session_;
    TransportConfig config_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace sqlmcp
