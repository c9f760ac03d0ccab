#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_orch {

using json = nlohmann::json;

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
};

/**
 * @brief Prompt advertised through prompts/list
 */
struct PromptDefinition {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;  // Ordered as declared

    json to_json() const;
};

/**
 * @brief Builds the MCP message list for a prompt
 * @param arguments Object of argument name to string value
 * @return JSON array of {role, content:{type, text}} messages
 */
using PromptBuilder = std::function<json(const json& arguments)>;

/**
 * @brief Returns candidate values for a partially typed argument
 */
using ArgumentCompleter = std::function<std::vector<std::string>(const std::string& partial)>;

/**
 * @brief Result of completion/complete
 */
struct CompletionValues {
    std::vector<std::string> values;
    std::size_t total = 0;
    bool has_more = false;

    json to_json() const;
};

/**
 * @brief Prompt catalog with per-name message builders
 *
 * Populated at startup and read-only afterwards.
 */
class PromptRegistry {
public:
    static constexpr std::size_t MAX_COMPLETION_VALUES = 100;

    /**
     * @throws std::invalid_argument on empty name, null builder or duplicate
     */
    void register_prompt(const PromptDefinition& definition, PromptBuilder builder);

    /**
     * @brief Attach a value completer to one argument of a prompt
     * @throws std::invalid_argument if prompt or argument is unknown
     */
    void register_completer(const std::string& prompt_name,
                            const std::string& argument_name,
                            ArgumentCompleter completer);

    const std::vector<PromptDefinition>& list() const { return prompts_; }

    bool has_prompt(const std::string& name) const;

    /**
     * @brief Build the prompt's messages
     * @return {description, messages}
     * @throws std::invalid_argument for unknown prompts or missing required arguments
     */
    json get(const std::string& name, const json& arguments) const;

    /**
     * @brief Complete a prompt argument value
     *
     * Candidates are filtered by case-insensitive prefix and capped at
     * MAX_COMPLETION_VALUES. Arguments without a completer yield no values.
     *
     * @throws std::invalid_argument if the prompt is unknown
     */
    CompletionValues complete(const std::string& prompt_name,
                              const std::string& argument_name,
                              const std::string& partial) const;

    /**
     * @brief Completer over a fixed list of choices
     */
    static ArgumentCompleter static_choices(std::vector<std::string> choices);

private:
    const PromptDefinition* find(const std::string& name) const;

    std::vector<PromptDefinition> prompts_;
    std::map<std::string, PromptBuilder> builders_;
    std::map<std::string, std::map<std::string, ArgumentCompleter>> completers_;
};

} // namespace mcp_orch
