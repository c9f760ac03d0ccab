#pragma once

#include "providers/Provider.hpp"
#include <map>

namespace mcp_orch {

/**
 * @brief OpenAI-compatible /chat/completions dialect
 *
 * Tools are sent as {type:"function", function:{name, description,
 * parameters}}; the system prompt stays inline; tool results are role
 * "tool" messages keyed by tool_call_id.
 */
class OpenAIProvider : public IProvider {
public:
    explicit OpenAIProvider(ProviderConfig config);

    ProviderKind kind() const override { return ProviderKind::OPENAI; }

    json translate_tools(const std::vector<ToolInfo>& tools) const override;

    HttpRequest build_request(const Transcript& transcript,
                              const json& provider_tools,
                              const GenerationParams& params,
                              const std::string& api_key) const override;

    CompletionResult parse_response(const json& body) const override;
    std::vector<ToolCallRequest> extract_tool_calls(const json& body) const override;
    json assistant_message(const CompletionResult& result) const override;
    std::vector<json> tool_result_messages(const std::vector<ToolCallRecord>& records) const override;

    std::string endpoint_identity() const override;
    const std::string& default_model() const override { return config_.model; }

protected:
    virtual std::string endpoint_url(const std::string& model) const;
    virtual std::map<std::string, std::string> auth_headers(const std::string& api_key) const;
    virtual bool model_in_body() const { return true; }

    ProviderConfig config_;
};

} // namespace mcp_orch
