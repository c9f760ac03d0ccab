#pragma once

#include "providers/OpenAIProvider.hpp"

namespace mcp_orch {

/**
 * @brief Azure OpenAI deployments dialect
 *
 * Same body and message shapes as OpenAI, but the model selects the
 * deployment in the URL path, an api-version query parameter is required
 * and the key travels in the "api-key" header.
 */
class AzureOpenAIProvider : public OpenAIProvider {
public:
    explicit AzureOpenAIProvider(ProviderConfig config);

    ProviderKind kind() const override { return ProviderKind::AZURE_OPENAI; }

protected:
    std::string endpoint_url(const std::string& model) const override;
    std::map<std::string, std::string> auth_headers(const std::string& api_key) const override;
    bool model_in_body() const override { return false; }
};

} // namespace mcp_orch
