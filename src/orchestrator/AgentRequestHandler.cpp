#include "orchestrator/AgentRequestHandler.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>

namespace mcp_orch {

namespace {

/**
 * @brief Envelope-level validation failure with its agent error code
 */
class AgentValidationError : public std::invalid_argument {
public:
    AgentValidationError(std::string code, const std::string& message)
        : std::invalid_argument(message), code_(std::move(code)) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

long long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

bool read_bool(const json& options, const char* key, bool fallback) {
    if (!options.contains(key) || options[key].is_null()) {
        return fallback;
    }
    if (!options[key].is_boolean()) {
        throw std::invalid_argument(std::string("options.") + key + " must be a boolean");
    }
    return options[key].get<bool>();
}

int read_positive_int(const json& options, const char* key, int fallback) {
    if (!options.contains(key) || options[key].is_null()) {
        return fallback;
    }
    const json& value = options[key];
    const bool in_range = value.is_number_unsigned()
        ? value.get<unsigned long long>() <= static_cast<unsigned long long>(std::numeric_limits<int>::max())
        : value.is_number_integer() && value.get<long long>() <= std::numeric_limits<int>::max();
    if (!value.is_number_integer() || !in_range || value.get<long long>() < 1) {
        throw std::invalid_argument(std::string("options.") + key + " must be a positive integer");
    }
    return value.get<int>();
}

// URLs of documents the tools actually read, first occurrence first
json collect_sources(const std::vector<ToolCallRecord>& records) {
    json sources = json::array();
    for (const auto& record : records) {
        if (!record.success || !record.result.is_object()) {
            continue;
        }
        auto url = record.result.find("url");
        if (url == record.result.end() || !url->is_string()) {
            continue;
        }
        if (std::find(sources.begin(), sources.end(), *url) == sources.end()) {
            sources.push_back(*url);
        }
    }
    return sources;
}

} // namespace

AgentOptions AgentOptions::from_json(const json& options, const OrchestratorDefaults& defaults) {
    AgentOptions result;
    result.auto_execute_tools = defaults.auto_execute_tools;
    result.max_tool_calls = defaults.max_iterations;
    result.include_tool_results = defaults.include_tool_results;
    result.temperature = defaults.temperature;
    result.max_tokens = defaults.max_tokens;
    result.system_prompt = defaults.system_prompt;

    if (options.is_null()) {
        return result;
    }
    if (!options.is_object()) {
        throw std::invalid_argument("options must be an object");
    }

    result.auto_execute_tools = read_bool(options, "autoExecuteTools", result.auto_execute_tools);
    result.include_tool_results = read_bool(options, "includeToolResults", result.include_tool_results);
    result.max_tool_calls = read_positive_int(options, "maxToolCalls", result.max_tool_calls);
    result.max_tokens = read_positive_int(options, "maxTokens", result.max_tokens);

    if (options.contains("temperature") && !options["temperature"].is_null()) {
        if (!options["temperature"].is_number()) {
            throw std::invalid_argument("options.temperature must be a number");
        }
        result.temperature = options["temperature"].get<double>();
        if (result.temperature < 0.0 || result.temperature > 2.0) {
            throw std::invalid_argument("options.temperature must be between 0 and 2");
        }
    }
    if (options.contains("model") && !options["model"].is_null()) {
        if (!options["model"].is_string()) {
            throw std::invalid_argument("options.model must be a string");
        }
        result.model = options["model"].get<std::string>();
    }
    if (options.contains("systemPrompt") && !options["systemPrompt"].is_null()) {
        if (!options["systemPrompt"].is_string()) {
            throw std::invalid_argument("options.systemPrompt must be a string");
        }
        result.system_prompt = options["systemPrompt"].get<std::string>();
    }
    return result;
}

AgentRequestHandler::AgentRequestHandler(std::shared_ptr<const ToolCallOrchestrator> orchestrator,
                                         OrchestratorDefaults defaults)
    : orchestrator_(std::move(orchestrator)), defaults_(std::move(defaults)) {
    if (!orchestrator_) {
        throw std::invalid_argument("Orchestrator cannot be null");
    }
}

json AgentRequestHandler::make_error(const std::string& message,
                                     const std::string& error_type,
                                     const std::string& error_code,
                                     const json& details) {
    json body = {
        {"response", nullptr},
        {"error", message},
        {"errorType", error_type},
        {"details", details}
    };
    if (!error_code.empty()) {
        body["errorCode"] = error_code;
    }
    return body;
}

std::string AgentRequestHandler::resolve_api_key(const RequestContext& context) {
    if (auto authorization = context.header("Authorization")) {
        const std::string prefix = "Bearer ";
        std::string value = *authorization;
        if (value.size() > prefix.size() && value.compare(0, prefix.size(), prefix) == 0) {
            value = value.substr(prefix.size());
        }
        if (!value.empty() && value != "Bearer") {
            return value;
        }
    }
    if (auto api_key = context.header("x-api-key")) {
        if (!api_key->empty()) {
            return *api_key;
        }
    }
    throw AuthenticationError("MISSING_API_KEY",
        "Missing AI provider API key: supply an Authorization: Bearer <key> or x-api-key header");
}

Transcript AgentRequestHandler::build_transcript(const json& payload, const AgentOptions& options) const {
    Transcript transcript;
    if (!options.system_prompt.empty()) {
        transcript.add_system(options.system_prompt);
    }

    if (payload.contains("history") && !payload["history"].is_null()) {
        const json& history = payload["history"];
        if (!history.is_array()) {
            throw AgentValidationError("INVALID_HISTORY", "history must be an array of {role, content} messages");
        }
        for (const auto& entry : history) {
            if (!entry.is_object() || !entry.contains("role") || !entry["role"].is_string() ||
                !entry.contains("content") || !entry["content"].is_string()) {
                throw AgentValidationError("INVALID_HISTORY", "history entries need string role and content");
            }
            const auto role = entry["role"].get<std::string>();
            const auto content = entry["content"].get<std::string>();
            if (role == "user") {
                transcript.add_user(content);
            } else if (role == "assistant") {
                transcript.add_assistant_text(content);
            } else if (role == "system") {
                transcript.add_system(content);
            } else {
                throw AgentValidationError("INVALID_HISTORY", "Unsupported history role: " + role);
            }
        }
    }

    transcript.add_user(payload["input"].get<std::string>());
    return transcript;
}

json AgentRequestHandler::handle(const json& payload, const RequestContext& context) const {
    const auto start = std::chrono::steady_clock::now();

    try {
        if (!payload.is_object()) {
            throw AgentValidationError("INVALID_REQUEST", "Agent request must be a JSON object");
        }
        if (!payload.contains("input") || !payload["input"].is_string() ||
            payload["input"].get<std::string>().empty()) {
            throw AgentValidationError("INVALID_INPUT", "Agent request requires a non-empty string 'input'");
        }
        if (payload.contains("mode") && !payload["mode"].is_string()) {
            throw AgentValidationError("INVALID_MODE", "'mode' must be a string");
        }

        AgentOptions options;
        try {
            options = AgentOptions::from_json(payload.value("options", json()), defaults_);
        } catch (const std::invalid_argument& e) {
            throw AgentValidationError("INVALID_OPTIONS", e.what());
        }

        const std::string api_key = resolve_api_key(context);
        Transcript transcript = build_transcript(payload, options);

        OrchestrationOptions run_options;
        run_options.auto_execute_tools = options.auto_execute_tools;
        run_options.max_iterations = options.max_tool_calls;
        run_options.temperature = options.temperature;
        run_options.max_tokens = options.max_tokens;
        run_options.model = options.model;

        spdlog::info("Agent request: {} chars, autoExecute={}, maxToolCalls={}",
                     payload["input"].get<std::string>().size(),
                     options.auto_execute_tools, options.max_tool_calls);

        OrchestrationResult result = orchestrator_->run(std::move(transcript), run_options, api_key, context.cancel);

        json tool_calls = json::array();
        for (const auto& record : result.tool_calls) {
            tool_calls.push_back(record.to_json(options.include_tool_results));
        }

        return {
            {"response", result.response},
            {"execution", {
                {"toolCalls", tool_calls},
                {"toolsExecuted", result.tools_executed},
                {"iterations", result.iterations},
                {"maxIterationsReached", result.max_iterations_reached},
                {"awaitingExecution", result.awaiting_execution}
            }},
            {"metadata", {
                {"tokensUsed", result.usage.total()},
                {"promptTokens", result.usage.prompt_tokens},
                {"completionTokens", result.usage.completion_tokens},
                {"duration", elapsed_ms(start)},
                {"model", result.model},
                {"sources", collect_sources(result.tool_calls)}
            }},
            {"error", nullptr}
        };

    } catch (const AgentValidationError& e) {
        spdlog::warn("Rejected agent request: {}", e.what());
        return make_error(e.what(), "ValidationError", e.code(), {{"duration", elapsed_ms(start)}});
    } catch (const AuthenticationError& e) {
        spdlog::warn("Agent request not authenticated: {}", e.what());
        return make_error(e.what(), "AuthenticationError", e.code(), {{"duration", elapsed_ms(start)}});
    } catch (const UpstreamProviderError& e) {
        spdlog::error("Agent request failed upstream: {}", e.what());
        return make_error(e.what(), "UpstreamProviderError", "UPSTREAM_ERROR", {
            {"status", e.status()},
            {"body", e.body()},
            {"duration", elapsed_ms(start)}
        });
    } catch (const CancelledError& e) {
        spdlog::info("Agent request cancelled: {}", e.what());
        return make_error(e.what(), "CancelledError", "CANCELLED", {{"duration", elapsed_ms(start)}});
    } catch (const std::exception& e) {
        spdlog::error("Agent request failed: {}", e.what());
        return make_error(std::string("Internal error: ") + e.what(), "InternalError", "INTERNAL_ERROR",
                          {{"duration", elapsed_ms(start)}});
    }
}

} // namespace mcp_orch
