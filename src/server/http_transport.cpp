#include "server/http_transport.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>
#include <stdexcept>

namespace sqlmcp {

HttpTransport::HttpTransport(std::shared_ptr<McpSession> session, const TransportConfig& config)
    : session_(std::move(session)),
      config_(config),
      server_(std::make_unique<httplib::Server>()) {
    if (!session_) {
        throw std::invalid_argument("HttpTransport requires a session");
    }
}

HttpTransport::~HttpTransport() = default;

// ============================================================================
// start() - registers routes, listens
// ============================================================================

void HttpTransport::start() {
    auto& svr = *server_;

    const auto pool_size = static_cast<size_t>(config_.threads);
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr.set_payload_max_length(static_cast<size_t>(config_.max_body_bytes));

    register_routes(svr);

    utils::log::info(std::format("Listening on http://{}:{}{} ({} threads)",
        config_.host, config_.port, config_.endpoint, pool_size));

    if (!svr.listen(config_.host, static_cast<int>(config_.port))) {
        throw std::runtime_error(std::format(
            "Failed to bind HTTP listener on {}:{}", config_.host, config_.port));
    }
}

void HttpTransport::stop() {
    if (server_) {
        server_->stop();
    }
    utils::log::info("HTTP transport stopped");
}

void HttpTransport::register_routes(httplib::Server& svr) {
    svr.Post(config_.endpoint, [this](const httplib::Request& req, httplib::Response& res) {
        handle_rpc(req, res);
    });
    svr.Get(http::kHealthPath, [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", http::kJsonContentType);
    });
}

// ============================================================================
// Handlers
// ============================================================================

void HttpTransport::handle_rpc(const httplib::Request& req, httplib::Response& res) {
    const auto reply = handle_body(req.body);
    res.status = reply.status;
    if (!reply.body.empty()) {
        res.set_content(reply.body, http::kJsonContentType);
    }
}

HttpTransport::Reply HttpTransport::handle_body(std::string_view body) {
    if (body.size() > static_cast<size_t>(config_.max_body_bytes)) {
        utils::log::warn(std::format("Rejected request body of {} bytes (limit {})",
            body.size(), config_.max_body_bytes));
        return {http::kPayloadTooLarge, ""};
    }

    auto response = session_->handle_message(body);
    if (!response) {
        return {http::kAccepted, ""};
    }
    return {http::kOk, std::move(*response)};
}

} // namespace sqlmcp
