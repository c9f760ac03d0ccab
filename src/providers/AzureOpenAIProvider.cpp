#include "providers/AzureOpenAIProvider.hpp"
#include <stdexcept>

namespace mcp_orch {

AzureOpenAIProvider::AzureOpenAIProvider(ProviderConfig config)
    : OpenAIProvider(std::move(config)) {
    if (config_.resolved_base_url().empty()) {
        throw std::invalid_argument("Azure OpenAI provider requires a base URL");
    }
    if (config_.api_version.empty()) {
        throw std::invalid_argument("Azure OpenAI provider requires an api-version");
    }
}

std::string AzureOpenAIProvider::endpoint_url(const std::string& model) const {
    return config_.resolved_base_url() + "/openai/deployments/" + model +
           "/chat/completions?api-version=" + config_.api_version;
}

std::map<std::string, std::string> AzureOpenAIProvider::auth_headers(const std::string& api_key) const {
    return {{"api-key", api_key}};
}

} // namespace mcp_orch
