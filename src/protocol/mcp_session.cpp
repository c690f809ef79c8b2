#include "protocol/mcp_session.hpp"
#include "protocol/json_rpc.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>
#include <stdexcept>

namespace sqlmcp {

namespace {

constexpr std::array<std::string_view, 3> kSupportedProtocolVersions = {
    "2024-11-05",
    "2025-03-26",
    "2025-06-18",
};

Json params_of(const Json& message) {
    const auto it = message.find("params");
    if (it == message.end() || it->is_null()) {
        return Json::object();
    }
    return *it;
}

bool valid_id(const Json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

} // anonymous namespace

McpSession::McpSession(std::shared_ptr<OperationDispatcher> dispatcher, ServerInfo info)
    : dispatcher_(std::move(dispatcher)),
      info_(std::move(info)) {
    if (!dispatcher_) {
        throw std::invalid_argument("McpSession requires a dispatcher");
    }
}

bool McpSession::is_supported_protocol_version(std::string_view version) {
    for (const auto supported : kSupportedProtocolVersions) {
        if (supported == version) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> McpSession::handle_message(std::string_view raw) {
    const Json message = Json::parse(raw.begin(), raw.end(), nullptr, false);
    if (message.is_discarded()) {
        utils::log::warn("Rejected message: invalid JSON");
        return dump_json(rpc::make_error(nullptr, rpc::error_code::PARSE_ERROR, "Parse error"));
    }

    auto response = handle(message);
    if (!response) {
        return std::nullopt;
    }
    return dump_json(*response);
}

std::optional<Json> McpSession::handle(const Json& message) {
    if (message.is_array()) {
        return handle_batch(message);
    }
    return handle_single(message);
}

std::optional<Json> McpSession::handle_batch(const Json& batch) {
    if (batch.empty()) {
        return rpc::make_error(nullptr, rpc::error_code::INVALID_REQUEST, "Invalid Request: empty batch");
    }

    Json responses = Json::array();
    for (const auto& message : batch) {
        if (auto response = handle_single(message)) {
            responses.push_back(std::move(*response));
        }
    }
    if (responses.empty()) {
        return std::nullopt;
    }
    return responses;
}

std::optional<Json> McpSession::handle_single(const Json& message) {
    if (!message.is_object()) {
        return rpc::make_error(nullptr, rpc::error_code::INVALID_REQUEST, "Invalid Request: expected an object");
    }

    const auto id_it = message.find("id");
    const bool is_notification = id_it == message.end();
    const Json id = is_notification ? Json(nullptr) : *id_it;

    if (!is_notification && !valid_id(id)) {
        return rpc::make_error(nullptr, rpc::error_code::INVALID_REQUEST, "Invalid Request: bad id");
    }

    const auto version_it = message.find("jsonrpc");
    if (version_it == message.end() || *version_it != rpc::kVersion) {
        if (is_notification) return std::nullopt;
        return rpc::make_error(id, rpc::error_code::INVALID_REQUEST,
            "Invalid Request: missing or invalid jsonrpc version");
    }

    const auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        if (is_notification) return std::nullopt;
        return rpc::make_error(id, rpc::error_code::INVALID_REQUEST,
            "Invalid Request: missing or invalid method");
    }

    const std::string method = method_it->get<std::string>();

    if (is_notification) {
        handle_notification(method);
        return std::nullopt;
    }

    try {
        const Json params = params_of(message);
        if (!params.is_object()) {
            return rpc::make_error(id, rpc::error_code::INVALID_PARAMS, "Invalid params: expected an object");
        }

        if (method == "initialize") {
            return handle_initialize(params, id);
        }
        if (method == "ping") {
            return rpc::make_result(id, Json::object());
        }
        if (method == "tools/list") {
            return handle_tools_list(id);
        }
        if (method == "tools/call") {
            return handle_tools_call(params, id);
        }
        if (method == "resources/list") {
            return handle_resources_list(id);
        }
        if (method == "resources/read") {
            return handle_resources_read(params, id);
        }

        utils::log::warn(std::format("Unknown method: {}", method));
        return rpc::make_error(id, rpc::error_code::METHOD_NOT_FOUND,
            std::format("Method not found: {}", method));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Method {} failed: {}", method, e.what()));
        return rpc::make_error(id, rpc::error_code::INTERNAL_ERROR,
            std::format("Internal error: {}", e.what()));
    }
}

void McpSession::handle_notification(const std::string& method) {
    if (method == "notifications/initialized") {
        initialized_.store(true, std::memory_order_release);
        utils::log::debug("Client initialized");
    } else if (method == "notifications/cancelled") {
        // In-flight statements cannot be interrupted
        utils::log::debug("Ignoring cancellation notification");
    } else {
        utils::log::debug(std::format("Ignoring notification: {}", method));
    }
}

// ============================================================================
// Method handlers
// ============================================================================

Json McpSession::handle_initialize(const Json& params, const Json& id) {
    std::string version = mcp::kLatestProtocolVersion;
    const auto requested = params.find("protocolVersion");
    if (requested != params.end() && requested->is_string() &&
        is_supported_protocol_version(requested->get<std::string>())) {
        version = requested->get<std::string>();
    }

    Json capabilities = Json::object();
    capabilities["tools"] = Json::object();
    capabilities["resources"] = Json::object();

    Json server_info = Json::object();
    server_info["name"] = info_.name;
    server_info["version"] = info_.version;

    Json result = Json::object();
    result["protocolVersion"] = version;
    result["capabilities"] = std::move(capabilities);
    result["serverInfo"] = std::move(server_info);

    utils::log::info(std::format("Session initialized (protocol {})", version));
    return rpc::make_result(id, std::move(result));
}

Json McpSession::handle_tools_list(const Json& id) const {
    Json result = Json::object();
    result["tools"] = dispatcher_->catalog().to_tools_json();
    return rpc::make_result(id, std::move(result));
}

Json McpSession::handle_tools_call(const Json& params, const Json& id) {
    const auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return rpc::make_error(id, rpc::error_code::INVALID_PARAMS, "Invalid params: missing tool name");
    }

    const auto args_it = params.find("arguments");
    const Json arguments = args_it == params.end() ? Json(nullptr) : *args_it;

    const auto response = dispatcher_->dispatch(name_it->get<std::string>(), arguments);
    return rpc::make_result(id, response.to_json());
}

Json McpSession::handle_resources_list(const Json& id) const {
    Json memo = Json::object();
    memo["uri"] = mcp::kMemoUri;
    memo["name"] = "Business Insights Memo";
    memo["description"] = "A living document of discovered business insights";
    memo["mimeType"] = mcp::kMemoMimeType;

    Json resources = Json::array();
    resources.push_back(std::move(memo));

    Json result = Json::object();
    result["resources"] = std::move(resources);
    return rpc::make_result(id, std::move(result));
}

Json McpSession::handle_resources_read(const Json& params, const Json& id) const {
    const auto uri_it = params.find("uri");
    if (uri_it == params.end() || !uri_it->is_string()) {
        return rpc::make_error(id, rpc::error_code::INVALID_PARAMS, "Invalid params: missing uri");
    }

    const std::string uri = uri_it->get<std::string>();
    if (uri != mcp::kMemoUri) {
        return rpc::make_error(id, rpc::error_code::INVALID_PARAMS,
            std::format("Unknown resource: {}", uri));
    }

    Json content = Json::object();
    content["uri"] = uri;
    content["mimeType"] = mcp::kMemoMimeType;
    content["text"] = dispatcher_->ledger()->synthesize();

    Json contents = Json::array();
    contents.push_back(std::move(content));

    Json result = Json::object();
    result["contents"] = std::move(contents);
    return rpc::make_result(id, std::move(result));
}

} // namespace sqlmcp
