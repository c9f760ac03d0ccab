#pragma once

#include "core/CancellationToken.hpp"
#include "core/HttpClient.hpp"
#include "core/TtlCache.hpp"
#include "providers/Provider.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mcp_orch {

/**
 * @brief Translated tool lists shared across requests, keyed by endpoint
 */
using ToolSpecCache = TtlCache<std::string, json>;

/**
 * @brief Performs one completion round trip against the configured provider
 */
class CompletionClient {
public:
    /**
     * @param provider Wire dialect
     * @param http HTTP transport
     * @param cache Optional shared cache of translated tool lists
     */
    CompletionClient(std::shared_ptr<IProvider> provider,
                     std::shared_ptr<IHttpClient> http,
                     std::shared_ptr<ToolSpecCache> cache = nullptr);

    /**
     * @brief Send the transcript and return the parsed response
     *
     * A response without tool calls is terminal for the caller.
     *
     * @throws UpstreamProviderError on network failure, timeout, non-2xx
     *         status or an unparsable body
     * @throws CancelledError if the token fires before or during the call
     */
    CompletionResult complete(const Transcript& transcript,
                              const std::vector<ToolInfo>& tools,
                              const GenerationParams& params,
                              const std::string& api_key,
                              const CancellationToken& cancel) const;

    const IProvider& provider() const { return *provider_; }

private:
    json provider_tools(const std::vector<ToolInfo>& tools) const;

    std::shared_ptr<IProvider> provider_;
    std::shared_ptr<IHttpClient> http_;
    std::shared_ptr<ToolSpecCache> cache_;
};

} // namespace mcp_orch
