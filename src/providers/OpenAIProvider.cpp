#include "providers/OpenAIProvider.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>

namespace mcp_orch {

namespace {

// content may be a string, null, or an array of {type:"text", text} parts
std::string message_text(const json& content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    std::string text;
    if (content.is_array()) {
        for (const auto& part : content) {
            if (part.is_object() && part.value("type", "") == "text" && part.contains("text") &&
                part["text"].is_string()) {
                text += part["text"].get<std::string>();
            }
        }
    }
    return text;
}

int read_int(const json& object, const char* key) {
    if (object.is_object() && object.contains(key) && object[key].is_number_integer()) {
        return object[key].get<int>();
    }
    return 0;
}

} // namespace

OpenAIProvider::OpenAIProvider(ProviderConfig config)
    : config_(std::move(config)) {}

json OpenAIProvider::translate_tools(const std::vector<ToolInfo>& tools) const {
    json result = json::array();
    for (const auto& tool : tools) {
        result.push_back({
            {"type", "function"},
            {"function", {
                {"name", tool.name},
                {"description", tool.description},
                {"parameters", tool_parameters_schema(tool)}
            }}
        });
    }
    return result;
}

std::string OpenAIProvider::endpoint_url(const std::string&) const {
    return config_.resolved_base_url() + "/chat/completions";
}

std::map<std::string, std::string> OpenAIProvider::auth_headers(const std::string& api_key) const {
    return {{"Authorization", "Bearer " + api_key}};
}

std::string OpenAIProvider::endpoint_identity() const {
    return config_.endpoint_identity();
}

HttpRequest OpenAIProvider::build_request(const Transcript& transcript,
                                          const json& provider_tools,
                                          const GenerationParams& params,
                                          const std::string& api_key) const {
    const std::string model = params.model.empty() ? config_.model : params.model;

    json body = {
        {"messages", transcript.messages()},
        {"temperature", params.temperature},
        {"max_tokens", params.max_tokens}
    };
    if (model_in_body()) {
        body["model"] = model;
    }
    if (provider_tools.is_array() && !provider_tools.empty()) {
        body["tools"] = provider_tools;
        body["tool_choice"] = "auto";
    }

    HttpRequest request;
    request.method = "POST";
    request.url = endpoint_url(model);
    request.headers = auth_headers(api_key);
    request.headers["Content-Type"] = "application/json";
    request.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    request.timeout_ms = config_.timeout_ms;
    return request;
}

std::vector<ToolCallRequest> OpenAIProvider::extract_tool_calls(const json& body) const {
    std::vector<ToolCallRequest> calls;

    if (!body.contains("choices") || !body["choices"].is_array() || body["choices"].empty()) {
        return calls;
    }
    const json& message = body["choices"][0].value("message", json::object());
    if (!message.is_object() || !message.contains("tool_calls") || !message["tool_calls"].is_array()) {
        return calls;
    }

    std::size_t index = 0;
    for (const auto& entry : message["tool_calls"]) {
        ++index;
        if (!entry.is_object() || !entry.contains("function") || !entry["function"].is_object()) {
            spdlog::warn("Skipping tool call without function payload");
            continue;
        }
        const json& function = entry["function"];

        ToolCallRequest call;
        call.id = entry.contains("id") && entry["id"].is_string()
            ? entry["id"].get<std::string>()
            : "call_" + std::to_string(index);
        call.name = function.value("name", "");

        const json payload = function.contains("arguments") ? function["arguments"] : json();
        if (payload.is_string()) {
            call.raw_arguments = payload.get<std::string>();
        } else if (!payload.is_null()) {
            call.raw_arguments = payload.dump();
        }
        call.arguments = parse_tool_arguments(payload, call.arguments_malformed);
        calls.push_back(std::move(call));
    }
    return calls;
}

CompletionResult OpenAIProvider::parse_response(const json& body) const {
    if (!body.is_object() || !body.contains("choices") || !body["choices"].is_array() ||
        body["choices"].empty()) {
        throw UpstreamProviderError("Provider response has no choices", 200, body.dump());
    }
    const json& choice = body["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        throw UpstreamProviderError("Provider response choice has no message", 200, body.dump());
    }
    const json& message = choice["message"];

    CompletionResult result;
    result.text = message_text(message.value("content", json()));
    result.tool_calls = extract_tool_calls(body);
    result.model = body.contains("model") && body["model"].is_string()
        ? body["model"].get<std::string>()
        : config_.model;
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        result.stop_reason = choice["finish_reason"].get<std::string>();
    }
    const json usage = body.value("usage", json::object());
    result.usage.prompt_tokens = read_int(usage, "prompt_tokens");
    result.usage.completion_tokens = read_int(usage, "completion_tokens");
    result.assistant_content = message;
    return result;
}

json OpenAIProvider::assistant_message(const CompletionResult& result) const {
    json message;
    if (result.assistant_content.is_object()) {
        // Keep provider fields such as refusal; tool_calls are rebuilt below
        message = result.assistant_content;
        message["role"] = "assistant";
        message.erase("tool_calls");
        if (!message.contains("content")) {
            message["content"] = nullptr;
        }
    } else {
        message = {
            {"role", "assistant"},
            {"content", result.text.empty() ? json() : json(result.text)}
        };
    }
    if (result.has_tool_calls()) {
        json calls = json::array();
        for (const auto& call : result.tool_calls) {
            calls.push_back({
                {"id", call.id},
                {"type", "function"},
                {"function", {
                    {"name", call.name},
                    {"arguments", call.arguments_malformed || call.raw_arguments.empty()
                        ? call.arguments.dump()
                        : call.raw_arguments}
                }}
            });
        }
        message["tool_calls"] = calls;
    }
    return message;
}

std::vector<json> OpenAIProvider::tool_result_messages(const std::vector<ToolCallRecord>& records) const {
    std::vector<json> messages;
    messages.reserve(records.size());
    for (const auto& record : records) {
        messages.push_back({
            {"role", "tool"},
            {"tool_call_id", record.id},
            {"content", record.result_text()}
        });
    }
    return messages;
}

} // namespace mcp_orch
