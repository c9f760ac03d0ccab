#include "providers/AnthropicProvider.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>

namespace mcp_orch {

namespace {

int read_int(const json& object, const char* key) {
    if (object.is_object() && object.contains(key) && object[key].is_number_integer()) {
        return object[key].get<int>();
    }
    return 0;
}

std::string system_text(const json& content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    std::string text;
    if (content.is_array()) {
        for (const auto& block : content) {
            if (block.is_object() && block.contains("text") && block["text"].is_string()) {
                text += block["text"].get<std::string>();
            }
        }
    }
    return text;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

AnthropicProvider::AnthropicProvider(ProviderConfig config)
    : config_(std::move(config)) {}

json AnthropicProvider::translate_tools(const std::vector<ToolInfo>& tools) const {
    json result = json::array();
    for (const auto& tool : tools) {
        result.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"input_schema", tool_parameters_schema(tool)}
        });
    }
    return result;
}

std::string AnthropicProvider::endpoint_url() const {
    const std::string base = config_.resolved_base_url();
    if (ends_with(base, "/v1")) {
        return base + "/messages";
    }
    return base + "/v1/messages";
}

std::string AnthropicProvider::endpoint_identity() const {
    return config_.endpoint_identity();
}

HttpRequest AnthropicProvider::build_request(const Transcript& transcript,
                                             const json& provider_tools,
                                             const GenerationParams& params,
                                             const std::string& api_key) const {
    std::string system;
    json messages = json::array();

    for (const auto& message : transcript.messages()) {
        if (message.value("role", "") == "system") {
            const std::string text = system_text(message.value("content", json()));
            if (!text.empty()) {
                if (!system.empty()) {
                    system += "\n\n";
                }
                system += text;
            }
            continue;
        }
        messages.push_back(message);
    }

    json body = {
        {"model", params.model.empty() ? config_.model : params.model},
        {"max_tokens", params.max_tokens},
        {"temperature", params.temperature},
        {"messages", messages}
    };
    if (!system.empty()) {
        body["system"] = system;
    }
    if (provider_tools.is_array() && !provider_tools.empty()) {
        body["tools"] = provider_tools;
    }

    HttpRequest request;
    request.method = "POST";
    request.url = endpoint_url();
    request.headers = {
        {"x-api-key", api_key},
        {"anthropic-version", config_.anthropic_version},
        {"Content-Type", "application/json"}
    };
    request.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    request.timeout_ms = config_.timeout_ms;
    return request;
}

std::vector<ToolCallRequest> AnthropicProvider::extract_tool_calls(const json& body) const {
    std::vector<ToolCallRequest> calls;
    if (!body.is_object() || !body.contains("content") || !body["content"].is_array()) {
        return calls;
    }

    std::size_t index = 0;
    for (const auto& block : body["content"]) {
        if (!block.is_object() || block.value("type", "") != "tool_use") {
            continue;
        }
        ++index;

        ToolCallRequest call;
        call.id = block.contains("id") && block["id"].is_string()
            ? block["id"].get<std::string>()
            : "toolu_" + std::to_string(index);
        call.name = block.value("name", "");

        const json payload = block.contains("input") ? block["input"] : json();
        call.raw_arguments = payload.is_string() ? payload.get<std::string>() : payload.dump();
        call.arguments = parse_tool_arguments(payload, call.arguments_malformed);
        calls.push_back(std::move(call));
    }
    return calls;
}

CompletionResult AnthropicProvider::parse_response(const json& body) const {
    if (!body.is_object() || !body.contains("content") || !body["content"].is_array()) {
        throw UpstreamProviderError("Provider response has no content blocks", 200, body.dump());
    }

    CompletionResult result;
    for (const auto& block : body["content"]) {
        if (block.is_object() && block.value("type", "") == "text" && block.contains("text") &&
            block["text"].is_string()) {
            if (!result.text.empty()) {
                result.text += "\n";
            }
            result.text += block["text"].get<std::string>();
        }
    }

    result.tool_calls = extract_tool_calls(body);
    result.model = body.contains("model") && body["model"].is_string()
        ? body["model"].get<std::string>()
        : config_.model;
    if (body.contains("stop_reason") && body["stop_reason"].is_string()) {
        result.stop_reason = body["stop_reason"].get<std::string>();
    }
    const json usage = body.value("usage", json::object());
    result.usage.prompt_tokens = read_int(usage, "input_tokens");
    result.usage.completion_tokens = read_int(usage, "output_tokens");
    result.assistant_content = body["content"];
    return result;
}

json AnthropicProvider::assistant_message(const CompletionResult& result) const {
    if (result.assistant_content.is_array() && !result.assistant_content.empty()) {
        // Echo the blocks as received so ordering and non-text blocks survive.
        // tool_use ids and inputs follow the normalized calls they produced.
        json content = result.assistant_content;
        std::size_t index = 0;
        for (auto& block : content) {
            if (!block.is_object() || !block.contains("type") || block["type"] != "tool_use") {
                continue;
            }
            if (index < result.tool_calls.size()) {
                const ToolCallRequest& call = result.tool_calls[index];
                block["id"] = call.id;
                if (call.arguments_malformed || !block.contains("input") || !block["input"].is_object()) {
                    block["input"] = call.arguments;
                }
            }
            ++index;
        }
        return {
            {"role", "assistant"},
            {"content", content}
        };
    }

    json content = json::array();
    if (!result.text.empty()) {
        content.push_back({{"type", "text"}, {"text", result.text}});
    }
    for (const auto& call : result.tool_calls) {
        content.push_back({
            {"type", "tool_use"},
            {"id", call.id},
            {"name", call.name},
            {"input", call.arguments}
        });
    }
    return {
        {"role", "assistant"},
        {"content", content}
    };
}

std::vector<json> AnthropicProvider::tool_result_messages(const std::vector<ToolCallRecord>& records) const {
    if (records.empty()) {
        return {};
    }

    json blocks = json::array();
    for (const auto& record : records) {
        json block = {
            {"type", "tool_result"},
            {"tool_use_id", record.id},
            {"content", record.result_text()}
        };
        if (!record.success) {
            block["is_error"] = true;
        }
        blocks.push_back(std::move(block));
    }
    return {json{{"role", "user"}, {"content", blocks}}};
}

} // namespace mcp_orch
