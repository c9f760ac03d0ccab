#pragma once

#include "core/Config.hpp"
#include "core/HttpClient.hpp"
#include "providers/Transcript.hpp"
#include "registry/ToolRegistry.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_orch {

using json = nlohmann::json;

/**
 * @brief Per-call generation settings
 */
struct GenerationParams {
    double temperature = 0.7;
    int max_tokens = 1024;
    std::string model;  // Empty means the configured model
};

/**
 * @brief Wire-format capability interface for an AI completion back end
 *
 * Each implementation owns one dialect end to end: tool schema translation,
 * request construction (endpoint, auth headers, body), response parsing and
 * the shape of assistant/tool-result turns appended to the transcript.
 * Exactly one provider is used for a whole transcript.
 */
class IProvider {
public:
    virtual ~IProvider() = default;

    virtual ProviderKind kind() const = 0;

    /**
     * @brief Convert neutral tool definitions to the provider's tool list
     */
    virtual json translate_tools(const std::vector<ToolInfo>& tools) const = 0;

    /**
     * @brief Build the HTTP request for one completion call
     * @param transcript Conversation so far
     * @param provider_tools Output of translate_tools (may be empty array)
     * @param params Generation settings
     * @param api_key Credential placed in the provider's auth header
     */
    virtual HttpRequest build_request(const Transcript& transcript,
                                      const json& provider_tools,
                                      const GenerationParams& params,
                                      const std::string& api_key) const = 0;

    /**
     * @brief Parse a successful response body
     * @throws UpstreamProviderError if the body lacks the expected structure
     */
    virtual CompletionResult parse_response(const json& body) const = 0;

    /**
     * @brief Pull requested tool calls out of a response body
     */
    virtual std::vector<ToolCallRequest> extract_tool_calls(const json& body) const = 0;

    /**
     * @brief Assistant turn (including its tool calls) in provider shape
     */
    virtual json assistant_message(const CompletionResult& result) const = 0;

    /**
     * @brief Tool result turn(s) in provider shape, in record order
     */
    virtual std::vector<json> tool_result_messages(const std::vector<ToolCallRecord>& records) const = 0;

    /**
     * @brief Key identifying the upstream endpoint (for caching)
     */
    virtual std::string endpoint_identity() const = 0;

    /**
     * @brief Model used when GenerationParams::model is empty
     */
    virtual const std::string& default_model() const = 0;
};

/**
 * @brief Parse a tool argument payload
 *
 * Objects pass through, strings are parsed as JSON. Anything malformed or
 * not an object yields an empty object and sets @p malformed.
 */
json parse_tool_arguments(const json& payload, bool& malformed);

/**
 * @brief Tool input schema as sent to providers
 *
 * Returns the schema unchanged when it is an object; otherwise an empty
 * object schema, since every dialect requires one.
 */
json tool_parameters_schema(const ToolInfo& tool);

} // namespace mcp_orch
