#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_orch {

using json = nlohmann::json;

/**
 * @brief Metadata for a registered tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Function signature for tool execution
 * @param args JSON object with tool arguments
 * @return JSON result
 * @throws ToolError on failure
 */
using ToolHandler = std::function<json(const json& args)>;

/**
 * @brief Name to {metadata, handler} dispatch table
 *
 * Populated at startup and read-only afterwards; concurrent execute() calls
 * are safe once registration is complete.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     * @throws std::invalid_argument on empty name, null handler or duplicate
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief All tools in registration order
     */
    const std::vector<ToolInfo>& list() const { return tools_; }

    bool has_tool(const std::string& name) const;

    /**
     * @brief Look up tool metadata
     * @return Pointer into the registry or nullptr when unknown
     */
    const ToolInfo* find(const std::string& name) const;

    /**
     * @brief Validate arguments and run the tool's handler
     *
     * Handler exceptions are normalized into ToolError: json type errors
     * become VALIDATION, json parse errors PARSE, anything else UNEXPECTED.
     *
     * @param name Tool name
     * @param args Arguments object
     * @return Handler result
     * @throws ToolNotFoundError if the tool is not registered
     * @throws ToolError on validation or execution failure
     */
    json execute(const std::string& name, const json& args) const;

    /**
     * @brief Check arguments against the schema's required list and declared
     * primitive types
     * @throws ToolError with kind VALIDATION
     */
    static void validate_arguments(const ToolInfo& info, const json& args);

    std::size_t size() const { return tools_.size(); }

private:
    std::vector<ToolInfo> tools_;
    std::map<std::string, std::size_t> index_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace mcp_orch
