#pragma once

#include "core/Config.hpp"
#include "core/RequestContext.hpp"
#include "registry/PromptRegistry.hpp"
#include "registry/ResourceReader.hpp"
#include "registry/ToolRegistry.hpp"
#include <array>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_orch {

using json = nlohmann::json;

/**
 * @brief MCP methods understood by the handler
 */
enum class McpMethod {
    INITIALIZE,
    INITIALIZED,
    PING,
    TOOLS_LIST,
    TOOLS_CALL,
    RESOURCES_LIST,
    RESOURCES_TEMPLATES_LIST,
    RESOURCES_READ,
    RESOURCES_SUBSCRIBE,
    RESOURCES_UNSUBSCRIBE,
    PROMPTS_LIST,
    PROMPTS_GET,
    COMPLETION_COMPLETE,
    COUNT  // Also returned for unknown method names
};

/**
 * @brief JSON-RPC 2.0 front end for the MCP method set
 *
 * Validates the envelope, dispatches through a table indexed by McpMethod
 * and renders every outcome, success or failure, as a response envelope.
 * Holds no per-session state: identical requests give identical results.
 */
class McpProtocolHandler {
public:
    McpProtocolHandler(ServerIdentity identity,
                       std::shared_ptr<const ToolRegistry> tools,
                       std::shared_ptr<const ResourceReader> resources,
                       std::shared_ptr<const PromptRegistry> prompts);

    /**
     * @brief Handle one JSON-RPC request
     * @param request Parsed request object
     * @param context Per-request headers and cancellation
     * @return Response envelope; never throws
     */
    json handle(const json& request, const RequestContext& context) const;

    /**
     * @brief Map a method name to its enum value, COUNT when unknown
     */
    static McpMethod parse_method(const std::string& method);

    static json make_result(const json& id, const json& result);
    static json make_error(const json& id, int code, const std::string& message, const json& data = json());

private:
    using MethodHandler = json (McpProtocolHandler::*)(const json& params, const RequestContext& context) const;

    json handle_initialize(const json& params, const RequestContext& context) const;
    json handle_empty(const json& params, const RequestContext& context) const;
    json handle_tools_list(const json& params, const RequestContext& context) const;
    json handle_tools_call(const json& params, const RequestContext& context) const;
    json handle_resources_list(const json& params, const RequestContext& context) const;
    json handle_resources_templates_list(const json& params, const RequestContext& context) const;
    json handle_resources_read(const json& params, const RequestContext& context) const;
    json handle_resources_subscribe(const json& params, const RequestContext& context) const;
    json handle_prompts_list(const json& params, const RequestContext& context) const;
    json handle_prompts_get(const json& params, const RequestContext& context) const;
    json handle_completion(const json& params, const RequestContext& context) const;

    static const std::array<MethodHandler, static_cast<std::size_t>(McpMethod::COUNT)> DISPATCH;

    ServerIdentity identity_;
    std::shared_ptr<const ToolRegistry> tools_;
    std::shared_ptr<const ResourceReader> resources_;
    std::shared_ptr<const PromptRegistry> prompts_;
};

} // namespace mcp_orch
