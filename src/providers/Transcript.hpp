#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_orch {

using json = nlohmann::json;

/**
 * @brief A tool invocation requested by the model
 */
struct ToolCallRequest {
    std::string id;              // Provider call id, used to correlate the result
    std::string name;
    json arguments = json::object();
    std::string raw_arguments;   // Payload as received
    bool arguments_malformed = false;
};

/**
 * @brief Token accounting for one or more completion calls
 */
struct TokenUsage {
    int prompt_tokens = 0;
    int completion_tokens = 0;

    int total() const { return prompt_tokens + completion_tokens; }

    TokenUsage& operator+=(const TokenUsage& other) {
        prompt_tokens += other.prompt_tokens;
        completion_tokens += other.completion_tokens;
        return *this;
    }
};

/**
 * @brief Provider-neutral view of one completion response
 */
struct CompletionResult {
    std::string text;
    std::vector<ToolCallRequest> tool_calls;
    TokenUsage usage;
    std::string model;
    std::string stop_reason;
    json assistant_content;  // Provider-shaped assistant payload; assistant_message() echoes it when set

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

/**
 * @brief Audit entry for one tool call within an orchestration run
 */
struct ToolCallRecord {
    std::string id;
    std::string name;
    json arguments = json::object();
    json result;          // Handler output when success
    std::string error;    // Failure message when !success
    std::string error_type;
    bool success = false;
    bool executed = true; // false in inspection mode

    /**
     * @brief Serialize for the agent response
     * @param include_result Whether to include the handler output
     */
    json to_json(bool include_result) const;

    /**
     * @brief Text fed back to the model as the tool result
     */
    std::string result_text() const;
};

/**
 * @brief Ordered message history for one orchestration run
 *
 * Messages are stored in the active provider's shape once the loop starts
 * appending assistant and tool turns. System and user turns use the
 * common {role, content:string} form that every provider accepts or
 * rewrites when building its request. Not shared between runs.
 */
class Transcript {
public:
    void add_system(const std::string& text);
    void add_user(const std::string& text);
    void add_assistant_text(const std::string& text);

    /**
     * @brief Append a message already in provider shape
     */
    void append(json message);

    const std::vector<json>& messages() const { return messages_; }
    std::size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }

private:
    std::vector<json> messages_;
};

} // namespace mcp_orch
