#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace mcp_orch {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

std::optional<std::string> StdioTransport::read_message() {
    std::string line;

    if (!std::getline(in_, line)) {
        if (in_.eof()) {
            spdlog::debug("Reached end of input stream");
        } else {
            spdlog::error("Error reading from input stream");
        }
        return std::nullopt;
    }

    // Tolerate CRLF framing
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    spdlog::debug("Read payload: {} bytes", line.size());
    return line;
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);
    out_ << serialized << std::endl;  // std::endl flushes automatically
    spdlog::debug("Wrote message: {} bytes", serialized.size());
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace mcp_orch
