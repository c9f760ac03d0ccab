#include "mcp/RequestRouter.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_orch {

RequestRouter::RequestRouter(std::shared_ptr<const McpProtocolHandler> mcp,
                             std::shared_ptr<const AgentRequestHandler> agent)
    : mcp_(std::move(mcp)), agent_(std::move(agent)) {
    if (!mcp_ || !agent_) {
        throw std::invalid_argument("Router requires both MCP and agent handlers");
    }
}

RequestKind RequestRouter::classify(const json& payload) {
    if (!payload.is_object()) {
        return RequestKind::UNKNOWN;
    }
    if (payload.contains("jsonrpc")) {
        return RequestKind::MCP;
    }
    if (payload.contains("mode") || payload.contains("input")) {
        return RequestKind::AGENT;
    }
    if (payload.contains("method")) {
        return RequestKind::UPGRADED_MCP;
    }
    return RequestKind::UNKNOWN;
}

json RequestRouter::route(const std::string& raw, const RequestContext& context) const {
    json payload;
    try {
        payload = json::parse(raw);
    } catch (const json::parse_error& e) {
        spdlog::warn("Rejected unparsable payload: {}", e.what());
        return AgentRequestHandler::make_error(std::string("Invalid JSON: ") + e.what(),
                                               "ParseError", "INVALID_JSON");
    }
    return dispatch(payload, context);
}

json RequestRouter::dispatch(const json& payload, const RequestContext& context) const {
    try {
        switch (classify(payload)) {
            case RequestKind::MCP:
                return mcp_->handle(payload, context);
            case RequestKind::AGENT:
                return agent_->handle(payload, context);
            case RequestKind::UPGRADED_MCP: {
                json upgraded = payload;
                upgraded["jsonrpc"] = "2.0";
                spdlog::debug("Upgraded bare method call to JSON-RPC 2.0");
                return mcp_->handle(upgraded, context);
            }
            case RequestKind::UNKNOWN:
                break;
        }
        return AgentRequestHandler::make_error(
            "Unknown request type: expected 'jsonrpc' or 'method' for MCP, or 'input'/'mode' for agent requests",
            "ValidationError", "UNKNOWN_REQUEST_TYPE");
    } catch (const std::exception& e) {
        spdlog::error("Routing failed: {}", e.what());
        return AgentRequestHandler::make_error(std::string("Internal error: ") + e.what(),
                                               "InternalError", "INTERNAL_ERROR");
    }
}

} // namespace mcp_orch
