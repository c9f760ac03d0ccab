#include "providers/Transcript.hpp"

namespace mcp_orch {

json ToolCallRecord::to_json(bool include_result) const {
    json entry = {
        {"id", id},
        {"tool", name},
        {"arguments", arguments},
        {"success", success},
        {"executed", executed}
    };
    if (!success && executed) {
        entry["error"] = error;
        if (!error_type.empty()) {
            entry["errorType"] = error_type;
        }
    }
    if (include_result && success) {
        entry["result"] = result;
    }
    return entry;
}

std::string ToolCallRecord::result_text() const {
    if (!success) {
        const json failure = {{"error", error}, {"errorType", error_type}};
        return failure.dump(-1, ' ', false, json::error_handler_t::replace);
    }
    if (result.is_string()) {
        return result.get<std::string>();
    }
    return result.dump(-1, ' ', false, json::error_handler_t::replace);
}

void Transcript::add_system(const std::string& text) {
    messages_.push_back({{"role", "system"}, {"content", text}});
}

void Transcript::add_user(const std::string& text) {
    messages_.push_back({{"role", "user"}, {"content", text}});
}

void Transcript::add_assistant_text(const std::string& text) {
    messages_.push_back({{"role", "assistant"}, {"content", text}});
}

void Transcript::append(json message) {
    messages_.push_back(std::move(message));
}

} // namespace mcp_orch
