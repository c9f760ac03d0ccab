#include "providers/ProviderFactory.hpp"
#include "providers/AnthropicProvider.hpp"
#include "providers/AzureOpenAIProvider.hpp"
#include "providers/OpenAIProvider.hpp"
#include <spdlog/spdlog.h>

namespace mcp_orch {

std::shared_ptr<IProvider> make_provider(const ProviderConfig& config) {
    spdlog::info("Using provider {} at {} (model {})",
                 to_string(config.kind), config.resolved_base_url(), config.model);

    switch (config.kind) {
        case ProviderKind::OPENAI:
            return std::make_shared<OpenAIProvider>(config);
        case ProviderKind::AZURE_OPENAI:
            return std::make_shared<AzureOpenAIProvider>(config);
        case ProviderKind::ANTHROPIC:
            return std::make_shared<AnthropicProvider>(config);
    }
    throw std::invalid_argument("Unsupported provider kind");
}

} // namespace mcp_orch
