#pragma once

#include "core/json.hpp"
#include <string>

namespace sqlmcp::rpc {

inline constexpr const char* kVersion = "2.0";

// JSON-RPC 2.0 error codes
namespace error_code {
    inline constexpr int PARSE_ERROR      = -32700;
    inline constexpr int INVALID_REQUEST  = -32600;
    inline constexpr int METHOD_NOT_FOUND = -32601;
    inline constexpr int INVALID_PARAMS   = -32602;
    inline constexpr int INTERNAL_ERROR   = -32603;
}

[[nodiscard]] inline Json make_result(const Json& id, Json result) {
    Json response = Json::object();
    response["jsonrpc"] = kVersion;
    response["id"] = id;
    response["result"] = std::move(result);
    return response;
}

[[nodiscard]] inline Json make_error(const Json& id, int code, const std::string& message) {
    Json error = Json::object();
    error["code"] = code;
    error["message"] = message;

    Json response = Json::object();
    response["jsonrpc"] = kVersion;
    response["id"] = id;
    response["error"] = std::move(error);
    return response;
}

} // namespace sqlmcp::rpc
