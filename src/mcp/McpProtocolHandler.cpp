#include "mcp/McpProtocolHandler.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unordered_map>

namespace mcp_orch {

namespace {

const json& require_object_params(const json& params) {
    if (!params.is_object()) {
        throw ProtocolError(rpc_error::INVALID_PARAMS, "Invalid params: expected an object");
    }
    return params;
}

std::string require_string(const json& params, const char* key) {
    if (!params.contains(key) || !params[key].is_string() || params[key].get<std::string>().empty()) {
        throw ProtocolError(rpc_error::INVALID_PARAMS,
                            std::string("Missing required parameter: ") + key);
    }
    return params[key].get<std::string>();
}

} // namespace

const std::array<McpProtocolHandler::MethodHandler, static_cast<std::size_t>(McpMethod::COUNT)>
McpProtocolHandler::DISPATCH = {
    &McpProtocolHandler::handle_initialize,                // INITIALIZE
    &McpProtocolHandler::handle_empty,                     // INITIALIZED
    &McpProtocolHandler::handle_empty,                     // PING
    &McpProtocolHandler::handle_tools_list,                // TOOLS_LIST
    &McpProtocolHandler::handle_tools_call,                // TOOLS_CALL
    &McpProtocolHandler::handle_resources_list,            // RESOURCES_LIST
    &McpProtocolHandler::handle_resources_templates_list,  // RESOURCES_TEMPLATES_LIST
    &McpProtocolHandler::handle_resources_read,            // RESOURCES_READ
    &McpProtocolHandler::handle_resources_subscribe,       // RESOURCES_SUBSCRIBE
    &McpProtocolHandler::handle_resources_subscribe,       // RESOURCES_UNSUBSCRIBE
    &McpProtocolHandler::handle_prompts_list,              // PROMPTS_LIST
    &McpProtocolHandler::handle_prompts_get,               // PROMPTS_GET
    &McpProtocolHandler::handle_completion                 // COMPLETION_COMPLETE
};

McpProtocolHandler::McpProtocolHandler(ServerIdentity identity,
                                       std::shared_ptr<const ToolRegistry> tools,
                                       std::shared_ptr<const ResourceReader> resources,
                                       std::shared_ptr<const PromptRegistry> prompts)
    : identity_(std::move(identity)),
      tools_(std::move(tools)),
      resources_(std::move(resources)),
      prompts_(std::move(prompts)) {
    if (!tools_ || !resources_ || !prompts_) {
        throw std::invalid_argument("MCP handler requires tool, resource and prompt registries");
    }
}

McpMethod McpProtocolHandler::parse_method(const std::string& method) {
    static const std::unordered_map<std::string, McpMethod> methods = {
        {"initialize", McpMethod::INITIALIZE},
        {"initialized", McpMethod::INITIALIZED},
        {"notifications/initialized", McpMethod::INITIALIZED},
        {"ping", McpMethod::PING},
        {"tools/list", McpMethod::TOOLS_LIST},
        {"tools/call", McpMethod::TOOLS_CALL},
        {"resources/list", McpMethod::RESOURCES_LIST},
        {"resources/templates/list", McpMethod::RESOURCES_TEMPLATES_LIST},
        {"resources/read", McpMethod::RESOURCES_READ},
        {"resources/subscribe", McpMethod::RESOURCES_SUBSCRIBE},
        {"resources/unsubscribe", McpMethod::RESOURCES_UNSUBSCRIBE},
        {"prompts/list", McpMethod::PROMPTS_LIST},
        {"prompts/get", McpMethod::PROMPTS_GET},
        {"completion/complete", McpMethod::COMPLETION_COMPLETE}
    };

    auto it = methods.find(method);
    return it == methods.end() ? McpMethod::COUNT : it->second;
}

json McpProtocolHandler::make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

json McpProtocolHandler::make_error(const json& id, int code, const std::string& message, const json& data) {
    json error = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error}
    };
}

json McpProtocolHandler::handle(const json& request, const RequestContext& context) const {
    if (!request.is_object()) {
        return make_error(json(), rpc_error::INVALID_REQUEST, "Invalid Request: expected a JSON object");
    }

    // Only string and number ids are echoed
    json id;
    if (request.contains("id") && (request["id"].is_string() || request["id"].is_number())) {
        id = request["id"];
    }

    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        return make_error(id, rpc_error::INVALID_REQUEST, "Invalid Request: missing or invalid jsonrpc field");
    }
    if (!request.contains("method") || !request["method"].is_string() ||
        request["method"].get<std::string>().empty()) {
        return make_error(id, rpc_error::INVALID_REQUEST, "Invalid Request: missing method field");
    }

    json params = json::object();
    if (request.contains("params")) {
        const json& raw = request["params"];
        if (raw.is_object() || raw.is_array()) {
            params = raw;
        } else if (!raw.is_null()) {
            return make_error(id, rpc_error::INVALID_REQUEST, "Invalid Request: params must be an object or array");
        }
    }

    const std::string method = request["method"].get<std::string>();
    spdlog::debug("Handling request: method={}, id={}", method, id.dump());

    const McpMethod parsed = parse_method(method);
    if (parsed == McpMethod::COUNT) {
        return make_error(id, rpc_error::METHOD_NOT_FOUND, "Method not found: " + method);
    }

    try {
        MethodHandler handler = DISPATCH[static_cast<std::size_t>(parsed)];
        return make_result(id, (this->*handler)(params, context));
    } catch (const ProtocolError& e) {
        spdlog::warn("Method {} failed with {}: {}", method, e.code(), e.what());
        return make_error(id, e.code(), e.what(), e.data());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", method, e.what());
        return make_error(id, rpc_error::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
}

json McpProtocolHandler::handle_initialize(const json& params, const RequestContext&) const {
    std::string protocol_version = identity_.protocol_version;
    if (params.is_object()) {
        if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
            protocol_version = params["protocolVersion"].get<std::string>();
        }
        if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
            const json& client = params["clientInfo"];
            auto field = [&client](const char* key) {
                return client.contains(key) && client[key].is_string()
                    ? client[key].get<std::string>()
                    : std::string("unknown");
            };
            spdlog::info("Client: {} version {}", field("name"), field("version"));
        }
    }

    return {
        {"protocolVersion", protocol_version},
        {"capabilities", {
            {"tools", {{"listChanged", false}}},
            {"resources", {{"subscribe", false}, {"listChanged", false}}},
            {"prompts", {{"listChanged", false}}},
            {"completions", json::object()}
        }},
        {"serverInfo", {
            {"name", identity_.name},
            {"version", identity_.version}
        }}
    };
}

json McpProtocolHandler::handle_empty(const json&, const RequestContext&) const {
    return json::object();
}

json McpProtocolHandler::handle_tools_list(const json&, const RequestContext&) const {
    json tools_array = json::array();
    for (const auto& info : tools_->list()) {
        tools_array.push_back({
            {"name", info.name},
            {"description", info.description},
            {"inputSchema", info.input_schema}
        });
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json McpProtocolHandler::handle_tools_call(const json& params, const RequestContext&) const {
    require_object_params(params);
    const std::string tool_name = require_string(params, "name");

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());

    json result;
    try {
        result = tools_->execute(tool_name, arguments);
    } catch (const ToolNotFoundError& e) {
        throw ProtocolError(rpc_error::METHOD_NOT_FOUND, e.what());
    } catch (const ToolError& e) {
        throw ProtocolError(to_rpc_code(e.kind()), e.what(), {
            {"type", std::string(to_string(e.kind()))},
            {"details", e.details()}
        });
    } catch (const CancelledError& e) {
        throw ProtocolError(rpc_error::SERVER_ERROR, e.what(), {{"type", "cancelled"}});
    }

    // Fetched documents may carry non-UTF-8 bytes; serialize with replacement
    const std::string text = result.is_string()
        ? result.get<std::string>()
        : result.dump(-1, ' ', false, json::error_handler_t::replace);

    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", text}
            }
        })}
    };
}

json McpProtocolHandler::handle_resources_list(const json&, const RequestContext&) const {
    json resources = json::array();
    for (const auto& descriptor : resources_->list()) {
        resources.push_back(descriptor.to_json());
    }
    return {{"resources", resources}};
}

json McpProtocolHandler::handle_resources_templates_list(const json&, const RequestContext&) const {
    json templates = json::array();
    for (const auto& descriptor : resources_->list_templates()) {
        templates.push_back(descriptor.to_json());
    }
    return {{"resourceTemplates", templates}};
}

json McpProtocolHandler::handle_resources_read(const json& params, const RequestContext& context) const {
    require_object_params(params);
    const std::string uri = require_string(params, "uri");

    try {
        ResourceContent content = resources_->read(uri, context.cancel);
        return {{"contents", json::array({content.to_json()})}};
    } catch (const ResourceReadError& e) {
        throw ProtocolError(rpc_error::SERVER_ERROR, e.what(), {
            {"uri", e.uri()},
            {"status", e.status()}
        });
    } catch (const CancelledError& e) {
        throw ProtocolError(rpc_error::SERVER_ERROR, e.what(), {{"uri", uri}, {"status", 0}});
    }
}

json McpProtocolHandler::handle_resources_subscribe(const json&, const RequestContext&) const {
    throw ProtocolError(rpc_error::METHOD_NOT_FOUND,
                        "Resource subscriptions are not supported: push notifications need a "
                        "persistent connection");
}

json McpProtocolHandler::handle_prompts_list(const json&, const RequestContext&) const {
    json prompts = json::array();
    for (const auto& definition : prompts_->list()) {
        prompts.push_back(definition.to_json());
    }
    return {{"prompts", prompts}};
}

json McpProtocolHandler::handle_prompts_get(const json& params, const RequestContext&) const {
    require_object_params(params);
    const std::string name = require_string(params, "name");

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    try {
        return prompts_->get(name, arguments);
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(rpc_error::INVALID_PARAMS, e.what());
    }
}

json McpProtocolHandler::handle_completion(const json& params, const RequestContext&) const {
    require_object_params(params);

    if (!params.contains("ref") || !params["ref"].is_object()) {
        throw ProtocolError(rpc_error::INVALID_PARAMS, "Missing required parameter: ref");
    }
    const json& ref = params["ref"];
    if (!ref.contains("type") || !ref["type"].is_string()) {
        throw ProtocolError(rpc_error::INVALID_PARAMS, "Completion reference type must be a string");
    }
    const std::string ref_type = ref["type"].get<std::string>();
    if (ref_type != "ref/prompt") {
        throw ProtocolError(rpc_error::INVALID_PARAMS, "Unsupported completion reference type: " + ref_type);
    }
    const std::string prompt_name = require_string(ref, "name");

    if (!params.contains("argument") || !params["argument"].is_object()) {
        throw ProtocolError(rpc_error::INVALID_PARAMS, "Missing required parameter: argument");
    }
    const json& argument = params["argument"];
    const std::string argument_name = require_string(argument, "name");
    std::string partial;
    if (argument.contains("value") && argument["value"].is_string()) {
        partial = argument["value"].get<std::string>();
    }

    try {
        return {{"completion", prompts_->complete(prompt_name, argument_name, partial).to_json()}};
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(rpc_error::INVALID_PARAMS, e.what());
    }
}

} // namespace mcp_orch
