#include "server/stdio_transport.hpp"
#include "core/utils.hpp"

#include <format>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace sqlmcp {

StdioTransport::StdioTransport(std::shared_ptr<McpSession> session, std::istream& in, std::ostream& out)
    : session_(std::move(session)), in_(in), out_(out) {
    if (!session_) {
        throw std::invalid_argument("StdioTransport requires a session");
    }
}

uint64_t StdioTransport::run() {
    running_.store(true, std::memory_order_release);
    uint64_t handled = 0;

    std::string line;
    while (running_.load(std::memory_order_acquire) && std::getline(in_, line)) {
        if (utils::trim(line).empty()) {
            continue;
        }

        ++handled;
        const auto response = session_->handle_message(line);
        if (response) {
            out_ << *response << '\n';
            out_.flush();
        }
    }

    running_.store(false, std::memory_order_release);
    utils::log::debug(std::format("stdio transport finished after {} messages", handled));
    return handled;
}

} // namespace sqlmcp
