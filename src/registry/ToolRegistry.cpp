#include "registry/ToolRegistry.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_orch {

namespace {

bool matches_json_type(const json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "array") return value.is_array();
    if (type == "object") return value.is_object();
    if (type == "null") return value.is_null();
    return true;  // Unknown type keywords are not enforced
}

} // namespace

void ToolRegistry::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }
    if (index_.count(info.name) > 0) {
        throw std::invalid_argument("Tool already registered: " + info.name);
    }

    index_[info.name] = tools_.size();
    tools_.push_back(info);
    handlers_[info.name] = std::move(handler);
    spdlog::info("Registered tool: {}", info.name);
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return index_.count(name) > 0;
}

const ToolInfo* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

void ToolRegistry::validate_arguments(const ToolInfo& info, const json& args) {
    if (!args.is_object()) {
        throw ToolError(ToolErrorKind::VALIDATION,
                        "Arguments for tool '" + info.name + "' must be an object");
    }

    const json& schema = info.input_schema;
    if (!schema.is_object()) {
        return;
    }

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& field : schema["required"]) {
            if (!field.is_string()) {
                continue;
            }
            const auto name = field.get<std::string>();
            if (!args.contains(name) || args[name].is_null()) {
                throw ToolError(ToolErrorKind::VALIDATION,
                                "Missing required parameter: " + name,
                                {{"tool", info.name}, {"parameter", name}});
            }
        }
    }

    if (schema.contains("properties") && schema["properties"].is_object()) {
        for (const auto& [name, property] : schema["properties"].items()) {
            if (!args.contains(name) || !property.is_object() || !property.contains("type")) {
                continue;
            }
            const json& type = property["type"];
            if (!type.is_string()) {
                continue;
            }
            const auto expected = type.get<std::string>();
            if (!matches_json_type(args[name], expected)) {
                throw ToolError(ToolErrorKind::VALIDATION,
                                "Parameter '" + name + "' must be of type " + expected,
                                {{"tool", info.name}, {"parameter", name}, {"expected", expected}});
            }
        }
    }
}

json ToolRegistry::execute(const std::string& name, const json& args) const {
    auto info_it = index_.find(name);
    if (info_it == index_.end()) {
        throw ToolNotFoundError(name);
    }
    const ToolInfo& info = tools_[info_it->second];

    validate_arguments(info, args);

    spdlog::debug("Executing tool: {} with args: {}", name, args.dump());

    try {
        return handlers_.at(name)(args);
    } catch (const ToolError&) {
        throw;
    } catch (const CancelledError&) {
        throw;
    } catch (const json::parse_error& e) {
        throw ToolError(ToolErrorKind::PARSE, e.what(), {{"tool", name}});
    } catch (const json::type_error& e) {
        throw ToolError(ToolErrorKind::VALIDATION, e.what(), {{"tool", name}});
    } catch (const std::invalid_argument& e) {
        throw ToolError(ToolErrorKind::VALIDATION, e.what(), {{"tool", name}});
    } catch (const std::exception& e) {
        spdlog::error("Tool {} failed unexpectedly: {}", name, e.what());
        throw ToolError(ToolErrorKind::UNEXPECTED, e.what(), {{"tool", name}});
    }
}

} // namespace mcp_orch
