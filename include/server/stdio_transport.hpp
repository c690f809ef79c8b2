#pragma once

#include "protocol/mcp_session.hpp"

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <memory>

namespace sqlmcp {

/**
 * @brief Newline-delimited JSON-RPC over a pair of streams (stdin/stdout)
 *
 * One message per line in, one response per line out, flushed after every
 * line. Blank lines are skipped. The output stream carries protocol traffic
 * only; diagnostics go through utils::log.
 */
class StdioTransport {
public:
    StdioTransport(std::shared_ptr<McpSession> session, std::istream& in, std::ostream& out);

    /**
     * @brief Serve messages until end of input or stop()
     * @return Number of messages handled
     */
    uint64_t run();

    /// Stop after the message currently being handled.
    void stop() { running_.store(false, std::memory_order_release); }

private:
    std::shared_ptr<McpSession> session_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
};

} // namespace sqlmcp
