#pragma once

#include "core/json.hpp"
#include "dispatcher/operation_dispatcher.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sqlmcp {

struct ServerInfo {
    std::string name = "sqlite-manager";
    std::string version = "0.1.0";
};

namespace mcp {
    inline constexpr const char* kLatestProtocolVersion = "2025-06-18";
    inline constexpr const char* kMemoUri = "memo://insights";
    inline constexpr const char* kMemoMimeType = "text/plain";
}

/**
 * @brief Model Context Protocol session over JSON-RPC 2.0
 *
 * Transport-agnostic: one inbound message in, zero or one outbound message
 * out. Handles initialize, ping, tools/list, tools/call, resources/list,
 * resources/read and notifications; tools/call is delegated to the
 * OperationDispatcher and its envelope becomes the JSON-RPC result.
 *
 * Thread-safe as long as the dispatcher is (HTTP workers share one session).
 */
class McpSession {
public:
    McpSession(std::shared_ptr<OperationDispatcher> dispatcher, ServerInfo info = {});

    /**
     * @brief Handle one raw message (single request or batch)
     * @return Serialized response, or std::nullopt when nothing is due
     *         (notifications, batches made only of notifications)
     */
    [[nodiscard]] std::optional<std::string> handle_message(std::string_view raw);

    /**
     * @brief Handle one parsed message
     */
    [[nodiscard]] std::optional<Json> handle(const Json& message);

    [[nodiscard]] bool initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    [[nodiscard]] static bool is_supported_protocol_version(std::string_view version);

private:
    [[nodiscard]] std::optional<Json> handle_single(const Json& message);
    [[nodiscard]] std::optional<Json> handle_batch(const Json& batch);

    [[nodiscard]] Json handle_initialize(const Json& params, const Json& id);
    [[nodiscard]] Json handle_tools_list(const Json& id) const;
    [[nodiscard]] Json handle_tools_call(const Json& params, const Json& id);
    [[nodiscard]] Json handle_resources_list(const Json& id) const;
    [[nodiscard]] Json handle_resources_read(const Json& params, const Json& id) const;

    void handle_notification(const std::string& method);

    std::shared_ptr<OperationDispatcher> dispatcher_;
    ServerInfo info_;
    std::atomic<bool> initialized_{false};
};

} // namespace sqlmcp
