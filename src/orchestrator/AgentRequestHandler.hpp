#pragma once

#include "core/Config.hpp"
#include "core/RequestContext.hpp"
#include "orchestrator/ToolCallOrchestrator.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_orch {

using json = nlohmann::json;

/**
 * @brief Options block of an agent request, with defaults applied
 */
struct AgentOptions {
    bool auto_execute_tools = true;
    int max_tool_calls = 10;
    bool include_tool_results = true;
    double temperature = 0.7;
    int max_tokens = 1024;
    std::string model;
    std::string system_prompt;

    /**
     * @brief Read the "options" object over the configured defaults
     * @throws std::invalid_argument on wrongly typed or out-of-range values
     */
    static AgentOptions from_json(const json& options, const OrchestratorDefaults& defaults);
};

/**
 * @brief Entry point for natural-language agent requests
 *
 * Validates the envelope, resolves the provider key from the request
 * headers, runs the orchestrator and renders the agent response envelope.
 * Never throws; every failure becomes a structured error body.
 */
class AgentRequestHandler {
public:
    AgentRequestHandler(std::shared_ptr<const ToolCallOrchestrator> orchestrator,
                        OrchestratorDefaults defaults);

    /**
     * @brief Handle a parsed agent payload
     * @param payload {input, mode?, history?, options?}
     * @param context Headers (Authorization / x-api-key) and cancellation
     */
    json handle(const json& payload, const RequestContext& context) const;

    /**
     * @brief Agent error envelope
     */
    static json make_error(const std::string& message,
                           const std::string& error_type,
                           const std::string& error_code,
                           const json& details = json::object());

    /**
     * @brief Extract the provider key from Authorization: Bearer or x-api-key
     * @throws AuthenticationError with code MISSING_API_KEY
     */
    static std::string resolve_api_key(const RequestContext& context);

private:
    Transcript build_transcript(const json& payload, const AgentOptions& options) const;

    std::shared_ptr<const ToolCallOrchestrator> orchestrator_;
    OrchestratorDefaults defaults_;
};

} // namespace mcp_orch
