#include "core/Config.hpp"
#include "core/CurlHttpClient.hpp"
#include "core/Errors.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/McpProtocolHandler.hpp"
#include "mcp/RequestRouter.hpp"
#include "mcp/StdioTransport.hpp"
#include "orchestrator/AgentRequestHandler.hpp"
#include "orchestrator/ToolCallOrchestrator.hpp"
#include "providers/CompletionClient.hpp"
#include "providers/ProviderFactory.hpp"
#include "registry/PromptRegistry.hpp"
#include "registry/ResourceReader.hpp"
#include "registry/ToolRegistry.hpp"
#include "tools/BuiltinPrompts.hpp"
#include "tools/FetchDocumentTool.hpp"
#include "tools/WeatherTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <optional>

namespace {
    constexpr const char* VERSION = "1.0.0";

    std::atomic<bool> shutdown_requested{false};
    mcp_orch::MCPServer* global_server = nullptr;

    void signal_handler(int signal) {
        spdlog::info("Received signal {}, shutting down gracefully", signal);
        shutdown_requested = true;
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    std::optional<spdlog::level::level_enum> parse_log_level(const std::string& level) {
        if (level == "trace") {
            return spdlog::level::trace;
        } else if (level == "debug") {
            return spdlog::level::debug;
        } else if (level == "info") {
            return spdlog::level::info;
        } else if (level == "warn") {
            return spdlog::level::warn;
        } else if (level == "error") {
            return spdlog::level::err;
        } else if (level == "critical") {
            return spdlog::level::critical;
        } else if (level == "off") {
            return spdlog::level::off;
        }
        return std::nullopt;
    }
}

int main(int argc, char** argv) {
    CLI::App app{"MCP Orchestrator - JSON-RPC and agent request router with tool-call orchestration"};

    std::string config_path;
    app.add_option("-c,--config", config_path, "Path to JSON config file")->check(CLI::ExistingFile);

    std::string log_level;
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical, off)");

    std::string provider;
    app.add_option("-p,--provider", provider, "AI provider (openai, azure, anthropic)");

    std::string model;
    app.add_option("-m,--model", model, "Model name (Azure: deployment name)");

    std::string base_url;
    app.add_option("--base-url", base_url, "Provider base URL");

    std::string api_version;
    app.add_option("--api-version", api_version, "Azure OpenAI api-version");

    int workers = 0;
    app.add_option("-w,--workers", workers, "Maximum concurrently handled requests")->check(CLI::PositiveNumber);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mcp-orchestrator version " << VERSION << std::endl;
        return 0;
    }

    // Protocol frames own stdout; logs go to stderr
    auto logger = spdlog::stderr_color_mt("mcp-orch");
    spdlog::set_default_logger(logger);

    mcp_orch::ServerConfig config;
    try {
        if (!config_path.empty()) {
            config = mcp_orch::ServerConfig::load_file(config_path);
        }
        config.apply_environment();

        if (!log_level.empty()) {
            config.log_level = log_level;
        }
        if (!provider.empty()) {
            config.provider.kind = mcp_orch::parse_provider_kind(provider);
        }
        if (!model.empty()) {
            config.provider.model = model;
        }
        if (!base_url.empty()) {
            config.provider.base_url = base_url;
        }
        if (!api_version.empty()) {
            config.provider.api_version = api_version;
        }
        if (workers > 0) {
            config.workers = workers;
        }

        config.validate();
    } catch (const mcp_orch::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    auto level = parse_log_level(config.log_level);
    if (!level) {
        std::cerr << "Invalid log level: " << config.log_level << std::endl;
        return 1;
    }
    spdlog::set_level(*level);

    spdlog::info("Starting mcp-orchestrator {}", VERSION);
    spdlog::info("Provider: {} ({}), model {}", mcp_orch::to_string(config.provider.kind),
                 config.provider.resolved_base_url(), config.provider.model);
    if (config.api_key.empty()) {
        spdlog::warn("No provider API key configured; agent requests must carry Authorization or x-api-key");
    }

    try {
        setup_signal_handlers();

        mcp_orch::CancellationToken shutdown;
        auto http = std::make_shared<mcp_orch::CurlHttpClient>(std::string("mcp-orchestrator/") + VERSION);

        // Resources
        auto resources = std::make_shared<mcp_orch::ResourceReader>(config.resources);
        auto web_fetcher = std::make_shared<mcp_orch::HttpResourceFetcher>(http, config.tool_timeout_ms);
        resources->register_scheme("http", web_fetcher);
        resources->register_scheme("https", web_fetcher);

        // Tools
        auto tools = std::make_shared<mcp_orch::ToolRegistry>();

        auto fetch_tool = std::make_shared<mcp_orch::FetchDocumentTool>(resources, shutdown);
        tools->register_tool(
            mcp_orch::FetchDocumentTool::get_info(),
            [fetch_tool](const nlohmann::json& args) {
                return fetch_tool->execute(args);
            }
        );

        auto weather_tool = std::make_shared<mcp_orch::WeatherTool>(
            http, config.weather_geocoding_url, config.weather_forecast_url, config.tool_timeout_ms, shutdown);
        tools->register_tool(
            mcp_orch::WeatherTool::get_info(),
            [weather_tool](const nlohmann::json& args) {
                return weather_tool->execute(args);
            }
        );

        // Prompts
        auto prompts = std::make_shared<mcp_orch::PromptRegistry>();
        mcp_orch::register_builtin_prompts(*prompts, resources, tools);

        // Provider and orchestration
        auto tool_cache = std::make_shared<mcp_orch::ToolSpecCache>(
            std::chrono::milliseconds(config.cache.ttl_ms), config.cache.max_entries);
        auto client = std::make_shared<mcp_orch::CompletionClient>(
            mcp_orch::make_provider(config.provider), http, tool_cache);
        auto orchestrator = std::make_shared<mcp_orch::ToolCallOrchestrator>(client, tools);
        auto agent = std::make_shared<mcp_orch::AgentRequestHandler>(orchestrator, config.orchestrator);
        auto mcp = std::make_shared<mcp_orch::McpProtocolHandler>(config.server, tools, resources, prompts);
        auto router = std::make_shared<mcp_orch::RequestRouter>(mcp, agent);

        std::map<std::string, std::string> headers;
        if (!config.api_key.empty()) {
            headers["Authorization"] = "Bearer " + config.api_key;
        }

        auto transport = std::make_unique<mcp_orch::StdioTransport>();
        auto server = std::make_unique<mcp_orch::MCPServer>(
            std::move(transport), router, config.workers, headers, shutdown);

        // Store global reference for signal handler
        global_server = server.get();

        spdlog::info("{} tool(s), {} prompt(s), {} resource(s) registered, starting server",
                     tools->size(), prompts->list().size(), config.resources.size());

        // Run server (blocks until stopped)
        server->run();

        global_server = nullptr;
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
