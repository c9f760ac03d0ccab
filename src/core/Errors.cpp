#include "core/Errors.hpp"

namespace mcp_orch {

std::string_view to_string(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::VALIDATION: return "validation";
        case ToolErrorKind::NETWORK:    return "network";
        case ToolErrorKind::PARSE:      return "parse";
        case ToolErrorKind::TIMEOUT:    return "timeout";
        case ToolErrorKind::UNEXPECTED: return "unexpected";
    }
    return "unexpected";
}

int to_rpc_code(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::VALIDATION: return rpc_error::INVALID_PARAMS;
        case ToolErrorKind::PARSE:      return rpc_error::PARSE_ERROR;
        case ToolErrorKind::NETWORK:
        case ToolErrorKind::TIMEOUT:
        case ToolErrorKind::UNEXPECTED:
            return rpc_error::SERVER_ERROR;
    }
    return rpc_error::SERVER_ERROR;
}

ToolError::ToolError(ToolErrorKind kind, const std::string& message, json details)
    : std::runtime_error(message), kind_(kind), details_(std::move(details)) {}

ToolNotFoundError::ToolNotFoundError(const std::string& tool_name)
    : std::runtime_error("Unknown tool: " + tool_name), tool_name_(tool_name) {}

ResourceReadError::ResourceReadError(const std::string& uri, const std::string& message, long status)
    : std::runtime_error(message), uri_(uri), status_(status) {}

UpstreamProviderError::UpstreamProviderError(const std::string& message, long status, std::string body)
    : std::runtime_error(message), status_(status), body_(std::move(body)) {}

AuthenticationError::AuthenticationError(std::string code, const std::string& message)
    : std::runtime_error(message), code_(std::move(code)) {}

CancelledError::CancelledError(const std::string& message)
    : std::runtime_error(message) {}

ProtocolError::ProtocolError(int code, const std::string& message, json data)
    : std::runtime_error(message), code_(code), data_(std::move(data)) {}

} // namespace mcp_orch
