#include "providers/CompletionClient.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_orch {

namespace {

// Upstream bodies can be large; keep log lines bounded
std::string truncate_for_log(const std::string& body, std::size_t limit = 512) {
    if (body.size() <= limit) {
        return body;
    }
    return body.substr(0, limit) + "...";
}

} // namespace

CompletionClient::CompletionClient(std::shared_ptr<IProvider> provider,
                                   std::shared_ptr<IHttpClient> http,
                                   std::shared_ptr<ToolSpecCache> cache)
    : provider_(std::move(provider)), http_(std::move(http)), cache_(std::move(cache)) {
    if (!provider_) {
        throw std::invalid_argument("Provider cannot be null");
    }
    if (!http_) {
        throw std::invalid_argument("HTTP client cannot be null");
    }
}

json CompletionClient::provider_tools(const std::vector<ToolInfo>& tools) const {
    if (tools.empty()) {
        return json::array();
    }
    if (!cache_) {
        return provider_->translate_tools(tools);
    }

    std::string key = provider_->endpoint_identity();
    for (const auto& tool : tools) {
        key += "|" + tool.name;
    }
    return cache_->get_or_compute(key, [&] {
        spdlog::debug("Translating {} tools for {}", tools.size(), provider_->endpoint_identity());
        return provider_->translate_tools(tools);
    });
}

CompletionResult CompletionClient::complete(const Transcript& transcript,
                                            const std::vector<ToolInfo>& tools,
                                            const GenerationParams& params,
                                            const std::string& api_key,
                                            const CancellationToken& cancel) const {
    if (cancel.is_cancelled()) {
        throw CancelledError("Completion cancelled before request");
    }

    HttpRequest request = provider_->build_request(transcript, provider_tools(tools), params, api_key);

    spdlog::debug("Completion request to {} ({} messages, {} tools)",
                  request.url, transcript.size(), tools.size());

    HttpResponse response = http_->send(request, cancel);

    if (response.cancelled) {
        throw CancelledError("Completion request cancelled");
    }
    if (response.timeout) {
        throw UpstreamProviderError("AI provider request timed out", 0, "");
    }
    if (response.network_error) {
        throw UpstreamProviderError("AI provider unreachable: " + response.network_error_message, 0, "");
    }
    if (response.status < 200 || response.status >= 300) {
        spdlog::error("AI provider returned HTTP {}: {}", response.status, truncate_for_log(response.body));
        throw UpstreamProviderError("AI provider returned HTTP " + std::to_string(response.status),
                                    response.status, response.body);
    }

    json body;
    try {
        body = json::parse(response.body);
    } catch (const json::parse_error& e) {
        spdlog::error("AI provider returned malformed JSON: {}", e.what());
        throw UpstreamProviderError(std::string("AI provider returned malformed JSON: ") + e.what(),
                                    response.status, response.body);
    }

    CompletionResult result;
    try {
        result = provider_->parse_response(body);
    } catch (const json::exception& e) {
        spdlog::error("AI provider response has an unexpected shape: {}", e.what());
        throw UpstreamProviderError(std::string("AI provider returned an unexpected response shape: ") + e.what(),
                                    response.status, response.body);
    }
    spdlog::debug("Completion returned {} tool calls, {} tokens (stop: {})",
                  result.tool_calls.size(), result.usage.total(), result.stop_reason);
    return result;
}

} // namespace mcp_orch
