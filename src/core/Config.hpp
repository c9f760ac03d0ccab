#pragma once

#include "registry/ResourceReader.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_orch {

using json = nlohmann::json;

/**
 * @brief Supported AI completion back ends
 */
enum class ProviderKind {
    OPENAI,        // OpenAI-compatible /chat/completions
    AZURE_OPENAI,  // Azure OpenAI deployments endpoint
    ANTHROPIC      // Anthropic-compatible /v1/messages
};

std::string_view to_string(ProviderKind kind);

/**
 * @brief Parse "openai", "azure"/"azure-openai" or "anthropic"
 * @throws ConfigError on unknown names
 */
ProviderKind parse_provider_kind(const std::string& name);

/**
 * @brief Connection settings for the active AI provider
 */
struct ProviderConfig {
    ProviderKind kind = ProviderKind::OPENAI;
    std::string base_url;            // Empty means the provider default
    std::string model = "gpt-4o-mini";
    std::string api_version = "2024-06-01";         // Azure only
    std::string anthropic_version = "2023-06-01";   // Anthropic only
    long timeout_ms = 60000;

    /**
     * @brief base_url or the well-known default for the provider kind
     */
    std::string resolved_base_url() const;

    /**
     * @brief Stable key identifying the upstream endpoint
     */
    std::string endpoint_identity() const;
};

/**
 * @brief Defaults applied to agent requests that omit options
 */
struct OrchestratorDefaults {
    int max_iterations = 10;
    double temperature = 0.7;
    int max_tokens = 1024;
    bool auto_execute_tools = true;
    bool include_tool_results = true;
    std::string system_prompt =
        "You are a helpful assistant. Use the available tools when they help answer the request.";
};

struct CacheConfig {
    long ttl_ms = 300000;
    std::size_t max_entries = 64;
};

struct ServerIdentity {
    std::string name = "mcp-orchestrator";
    std::string version = "1.0.0";
    std::string protocol_version = "2024-11-05";
};

/**
 * @brief Process-wide configuration, loaded once at startup
 */
struct ServerConfig {
    ServerIdentity server;
    ProviderConfig provider;
    OrchestratorDefaults orchestrator;
    CacheConfig cache;
    std::vector<ResourceDescriptor> resources;
    std::string api_key;
    int workers = 4;
    std::string log_level = "info";
    std::string weather_geocoding_url = "https://geocoding-api.open-meteo.com/v1/search";
    std::string weather_forecast_url = "https://api.open-meteo.com/v1/forecast";
    long tool_timeout_ms = 15000;

    /**
     * @brief Build from a parsed config document; absent keys keep defaults
     *
     * Does not call validate(); environment and CLI overrides come first.
     *
     * @throws ConfigError on wrong types or unknown provider names
     */
    static ServerConfig from_json(const json& document);

    /**
     * @brief Read and parse a JSON config file
     * @throws ConfigError if the file is missing or malformed
     */
    static ServerConfig load_file(const std::filesystem::path& path);

    /**
     * @brief Apply MCP_ORCH_* and provider API key environment variables
     */
    void apply_environment();

    /**
     * @brief Check cross-field invariants
     * @throws ConfigError
     */
    void validate() const;
};

} // namespace mcp_orch
