#pragma once

#include "providers/Provider.hpp"

namespace mcp_orch {

/**
 * @brief Anthropic-compatible /v1/messages dialect
 *
 * Tools carry input_schema instead of parameters. System turns are lifted
 * out of the transcript into the top-level "system" field. Tool calls are
 * tool_use content blocks and results go back as tool_result blocks inside
 * a single user message.
 */
class AnthropicProvider : public IProvider {
public:
    explicit AnthropicProvider(ProviderConfig config);

    ProviderKind kind() const override { return ProviderKind::ANTHROPIC; }

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

private:
    std::string endpoint_url() const;

    ProviderConfig config_;
};

} // namespace mcp_orch
