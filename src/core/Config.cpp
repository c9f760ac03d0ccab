#include "core/Config.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>

namespace mcp_orch {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::optional<std::string> read_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    std::string trimmed = trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

const json* section(const json& document, const char* name) {
    if (!document.contains(name)) {
        return nullptr;
    }
    const json& value = document[name];
    if (!value.is_object()) {
        throw ConfigError(std::string("Config section '") + name + "' must be an object");
    }
    return &value;
}

template <typename T>
void read_field(const json& object, const char* key, T& target) {
    if (!object.contains(key) || object[key].is_null()) {
        return;
    }
    try {
        target = object[key].get<T>();
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Config field '") + key + "' has wrong type: " + e.what());
    }
}

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

std::string_view to_string(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::OPENAI:       return "openai";
        case ProviderKind::AZURE_OPENAI: return "azure-openai";
        case ProviderKind::ANTHROPIC:    return "anthropic";
    }
    return "openai";
}

ProviderKind parse_provider_kind(const std::string& name) {
    const std::string normalized = to_lower(trim(name));
    if (normalized == "openai") {
        return ProviderKind::OPENAI;
    }
    if (normalized == "azure" || normalized == "azure-openai" || normalized == "azure_openai") {
        return ProviderKind::AZURE_OPENAI;
    }
    if (normalized == "anthropic") {
        return ProviderKind::ANTHROPIC;
    }
    throw ConfigError("Unknown provider: " + name + " (expected openai, azure-openai or anthropic)");
}

std::string ProviderConfig::resolved_base_url() const {
    if (!base_url.empty()) {
        return strip_trailing_slash(base_url);
    }
    switch (kind) {
        case ProviderKind::OPENAI:       return "https://api.openai.com/v1";
        case ProviderKind::ANTHROPIC:    return "https://api.anthropic.com";
        case ProviderKind::AZURE_OPENAI: return "";  // Resource-specific, must be configured
    }
    return "";
}

std::string ProviderConfig::endpoint_identity() const {
    return std::string(to_string(kind)) + "|" + resolved_base_url() + "|" + model;
}

ServerConfig ServerConfig::from_json(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Config document must be a JSON object");
    }

    ServerConfig config;

    if (const json* server = section(document, "server")) {
        read_field(*server, "name", config.server.name);
        read_field(*server, "version", config.server.version);
        read_field(*server, "protocolVersion", config.server.protocol_version);
        read_field(*server, "workers", config.workers);
    }

    if (const json* provider = section(document, "provider")) {
        std::string kind;
        read_field(*provider, "type", kind);
        if (!kind.empty()) {
            config.provider.kind = parse_provider_kind(kind);
        }
        read_field(*provider, "baseUrl", config.provider.base_url);
        read_field(*provider, "model", config.provider.model);
        read_field(*provider, "apiVersion", config.provider.api_version);
        read_field(*provider, "anthropicVersion", config.provider.anthropic_version);
        read_field(*provider, "timeoutMs", config.provider.timeout_ms);
        read_field(*provider, "apiKey", config.api_key);
    }

    if (const json* orchestrator = section(document, "orchestrator")) {
        read_field(*orchestrator, "maxIterations", config.orchestrator.max_iterations);
        read_field(*orchestrator, "temperature", config.orchestrator.temperature);
        read_field(*orchestrator, "maxTokens", config.orchestrator.max_tokens);
        read_field(*orchestrator, "autoExecuteTools", config.orchestrator.auto_execute_tools);
        read_field(*orchestrator, "includeToolResults", config.orchestrator.include_tool_results);
        read_field(*orchestrator, "systemPrompt", config.orchestrator.system_prompt);
    }

    if (const json* cache = section(document, "cache")) {
        read_field(*cache, "ttlMs", config.cache.ttl_ms);
        read_field(*cache, "maxEntries", config.cache.max_entries);
    }

    if (const json* tools = section(document, "tools")) {
        read_field(*tools, "timeoutMs", config.tool_timeout_ms);
        read_field(*tools, "weatherGeocodingUrl", config.weather_geocoding_url);
        read_field(*tools, "weatherForecastUrl", config.weather_forecast_url);
    }

    if (const json* logging = section(document, "logging")) {
        read_field(*logging, "level", config.log_level);
    }

    if (document.contains("resources")) {
        const json& resources = document["resources"];
        if (!resources.is_array()) {
            throw ConfigError("Config field 'resources' must be an array");
        }
        for (const auto& entry : resources) {
            if (!entry.is_object() || !entry.contains("uri") || !entry["uri"].is_string()) {
                throw ConfigError("Each resource needs a string 'uri'");
            }
            ResourceDescriptor descriptor;
            read_field(entry, "uri", descriptor.uri);
            read_field(entry, "name", descriptor.name);
            read_field(entry, "description", descriptor.description);
            read_field(entry, "mimeType", descriptor.mime_type);
            if (descriptor.name.empty()) {
                descriptor.name = descriptor.uri;
            }
            config.resources.push_back(std::move(descriptor));
        }
    }

    return config;
}

ServerConfig ServerConfig::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed config file " + path.string() + ": " + e.what());
    }

    spdlog::info("Loaded config from {}", path.string());
    return from_json(document);
}

void ServerConfig::apply_environment() {
    if (auto value = read_env("MCP_ORCH_PROVIDER")) {
        provider.kind = parse_provider_kind(*value);
    }
    if (auto value = read_env("MCP_ORCH_BASE_URL")) {
        provider.base_url = *value;
    }
    if (auto value = read_env("MCP_ORCH_MODEL")) {
        provider.model = *value;
    }
    if (auto value = read_env("MCP_ORCH_API_VERSION")) {
        provider.api_version = *value;
    }
    if (auto value = read_env("MCP_ORCH_LOG_LEVEL")) {
        log_level = *value;
    }

    if (auto value = read_env("MCP_ORCH_API_KEY")) {
        api_key = *value;
        return;
    }
    if (!api_key.empty()) {
        return;
    }

    const char* provider_var = nullptr;
    switch (provider.kind) {
        case ProviderKind::OPENAI:       provider_var = "OPENAI_API_KEY"; break;
        case ProviderKind::AZURE_OPENAI: provider_var = "AZURE_OPENAI_API_KEY"; break;
        case ProviderKind::ANTHROPIC:    provider_var = "ANTHROPIC_API_KEY"; break;
    }
    if (auto value = read_env(provider_var)) {
        api_key = *value;
    }
}

void ServerConfig::validate() const {
    if (provider.kind == ProviderKind::AZURE_OPENAI && provider.base_url.empty()) {
        throw ConfigError("Azure OpenAI requires provider.baseUrl (https://<resource>.openai.azure.com)");
    }
    if (provider.model.empty()) {
        throw ConfigError("provider.model must not be empty");
    }
    if (provider.timeout_ms <= 0 || tool_timeout_ms <= 0) {
        throw ConfigError("Timeouts must be positive");
    }
    if (orchestrator.max_iterations < 1) {
        throw ConfigError("orchestrator.maxIterations must be at least 1");
    }
    if (orchestrator.max_tokens < 1) {
        throw ConfigError("orchestrator.maxTokens must be at least 1");
    }
    if (cache.ttl_ms <= 0 || cache.max_entries == 0) {
        throw ConfigError("cache.ttlMs and cache.maxEntries must be positive");
    }
    if (workers < 1) {
        throw ConfigError("server.workers must be at least 1");
    }
}

} // namespace mcp_orch
