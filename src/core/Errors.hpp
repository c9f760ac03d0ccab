#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace mcp_orch {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 error codes used by the MCP handler
 */
namespace rpc_error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    constexpr int SERVER_ERROR = -32000;
} // namespace rpc_error

/**
 * @brief Failure classes a tool handler may raise
 */
enum class ToolErrorKind {
    VALIDATION,  // Bad or missing arguments
    NETWORK,     // Backing API unreachable or returned non-2xx
    PARSE,       // Backing API returned malformed data
    TIMEOUT,     // Backing API did not answer in time
    UNEXPECTED   // Anything else
};

std::string_view to_string(ToolErrorKind kind);

/**
 * @brief Map a tool failure class to the JSON-RPC code reported by tools/call
 */
int to_rpc_code(ToolErrorKind kind);

/**
 * @brief Error raised while executing a registered tool
 */
class ToolError : public std::runtime_error {
public:
    ToolError(ToolErrorKind kind, const std::string& message, json details = json());

    ToolErrorKind kind() const { return kind_; }
    const json& details() const { return details_; }

private:
    ToolErrorKind kind_;
    json details_;
};

/**
 * @brief Raised when a tool name is not present in the registry
 */
class ToolNotFoundError : public std::runtime_error {
public:
    explicit ToolNotFoundError(const std::string& tool_name);

    const std::string& tool_name() const { return tool_name_; }

private:
    std::string tool_name_;
};

/**
 * @brief Raised when a resource URI cannot be fetched or normalized
 */
class ResourceReadError : public std::runtime_error {
public:
    ResourceReadError(const std::string& uri, const std::string& message, long status = 0);

    const std::string& uri() const { return uri_; }
    long status() const { return status_; }

private:
    std::string uri_;
    long status_;
};

/**
 * @brief Failure talking to the AI provider
 *
 * Status is 0 for network-level failures (no HTTP response at all).
 */
class UpstreamProviderError : public std::runtime_error {
public:
    UpstreamProviderError(const std::string& message, long status, std::string body);

    long status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    long status_;
    std::string body_;
};

/**
 * @brief Missing or unusable provider credentials
 */
class AuthenticationError : public std::runtime_error {
public:
    AuthenticationError(std::string code, const std::string& message);

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

/**
 * @brief Raised when the request's cancellation token fires
 */
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& message = "Operation cancelled");
};

/**
 * @brief JSON-RPC level failure carrying the code to report
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message, json data = json());

    int code() const { return code_; }
    const json& data() const { return data_; }

private:
    int code_;
    json data_;
};

/**
 * @brief Invalid startup configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace mcp_orch
