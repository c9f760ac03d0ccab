#pragma once

#include "core/RequestContext.hpp"
#include "mcp/McpProtocolHandler.hpp"
#include "orchestrator/AgentRequestHandler.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_orch {

using json = nlohmann::json;

/**
 * @brief Shape of an inbound payload
 */
enum class RequestKind {
    MCP,            // Has a jsonrpc field
    AGENT,          // Has mode or input
    UPGRADED_MCP,   // Bare {method, ...}; jsonrpc is injected
    UNKNOWN
};

/**
 * @brief Single entry point for raw inbound payloads
 *
 * Classifies the payload and hands it to the MCP or agent handler.
 */
class RequestRouter {
public:
    RequestRouter(std::shared_ptr<const McpProtocolHandler> mcp,
                  std::shared_ptr<const AgentRequestHandler> agent);

    /**
     * @brief Parse, classify and dispatch one payload
     * @param raw Payload text
     * @param context Per-request headers and cancellation
     * @return JSON-RPC envelope or agent body; never throws
     */
    json route(const std::string& raw, const RequestContext& context) const;

    /**
     * @brief Dispatch an already parsed payload
     */
    json dispatch(const json& payload, const RequestContext& context) const;

    /**
     * @brief Classify a parsed payload by its discriminator fields
     */
    static RequestKind classify(const json& payload);

private:
    std::shared_ptr<const McpProtocolHandler> mcp_;
    std::shared_ptr<const AgentRequestHandler> agent_;
};

} // namespace mcp_orch
