#include "providers/Provider.hpp"
#include <spdlog/spdlog.h>

namespace mcp_orch {

json parse_tool_arguments(const json& payload, bool& malformed) {
    malformed = false;

    if (payload.is_object()) {
        return payload;
    }
    if (payload.is_null()) {
        return json::object();
    }
    if (payload.is_string()) {
        const auto& raw = payload.get_ref<const std::string&>();
        if (raw.empty()) {
            return json::object();
        }
        try {
            json parsed = json::parse(raw);
            if (parsed.is_object()) {
                return parsed;
            }
        } catch (const json::parse_error& e) {
            spdlog::warn("Malformed tool arguments, using empty object: {}", e.what());
        }
    }

    malformed = true;
    return json::object();
}

json tool_parameters_schema(const ToolInfo& tool) {
    if (tool.input_schema.is_object()) {
        return tool.input_schema;
    }
    return {
        {"type", "object"},
        {"properties", json::object()}
    };
}

} // namespace mcp_orch
