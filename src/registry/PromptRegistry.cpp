#include "registry/PromptRegistry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mcp_orch {

namespace {

bool starts_with_ignore_case(const std::string& value, const std::string& prefix) {
    if (prefix.size() > value.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), value.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace

json PromptDefinition::to_json() const {
    json args = json::array();
    for (const auto& argument : arguments) {
        args.push_back({
            {"name", argument.name},
            {"description", argument.description},
            {"required", argument.required}
        });
    }
    return {
        {"name", name},
        {"description", description},
        {"arguments", args}
    };
}

json CompletionValues::to_json() const {
    return {
        {"values", values},
        {"total", total},
        {"hasMore", has_more}
    };
}

void PromptRegistry::register_prompt(const PromptDefinition& definition, PromptBuilder builder) {
    if (definition.name.empty()) {
        throw std::invalid_argument("Prompt name cannot be empty");
    }
    if (!builder) {
        throw std::invalid_argument("Prompt builder cannot be null");
    }
    if (builders_.count(definition.name) > 0) {
        throw std::invalid_argument("Prompt already registered: " + definition.name);
    }

    prompts_.push_back(definition);
    builders_[definition.name] = std::move(builder);
    spdlog::info("Registered prompt: {}", definition.name);
}

void PromptRegistry::register_completer(const std::string& prompt_name,
                                        const std::string& argument_name,
                                        ArgumentCompleter completer) {
    const PromptDefinition* definition = find(prompt_name);
    if (!definition) {
        throw std::invalid_argument("Unknown prompt: " + prompt_name);
    }
    const bool declared = std::any_of(definition->arguments.begin(), definition->arguments.end(),
        [&](const PromptArgument& argument) { return argument.name == argument_name; });
    if (!declared) {
        throw std::invalid_argument("Prompt " + prompt_name + " has no argument " + argument_name);
    }
    if (!completer) {
        throw std::invalid_argument("Argument completer cannot be null");
    }
    completers_[prompt_name][argument_name] = std::move(completer);
}

bool PromptRegistry::has_prompt(const std::string& name) const {
    return builders_.count(name) > 0;
}

const PromptDefinition* PromptRegistry::find(const std::string& name) const {
    for (const auto& prompt : prompts_) {
        if (prompt.name == name) {
            return &prompt;
        }
    }
    return nullptr;
}

json PromptRegistry::get(const std::string& name, const json& arguments) const {
    const PromptDefinition* definition = find(name);
    if (!definition) {
        throw std::invalid_argument("Unknown prompt: " + name);
    }
    if (!arguments.is_null() && !arguments.is_object()) {
        throw std::invalid_argument("Prompt arguments must be an object");
    }

    const json args = arguments.is_object() ? arguments : json::object();
    for (const auto& argument : definition->arguments) {
        if (argument.required && (!args.contains(argument.name) || args[argument.name].is_null())) {
            throw std::invalid_argument("Missing required argument: " + argument.name);
        }
    }

    json messages = builders_.at(name)(args);
    return {
        {"description", definition->description},
        {"messages", messages}
    };
}

CompletionValues PromptRegistry::complete(const std::string& prompt_name,
                                          const std::string& argument_name,
                                          const std::string& partial) const {
    if (!has_prompt(prompt_name)) {
        throw std::invalid_argument("Unknown prompt: " + prompt_name);
    }

    CompletionValues result;
    auto prompt_it = completers_.find(prompt_name);
    if (prompt_it == completers_.end()) {
        return result;
    }
    auto completer_it = prompt_it->second.find(argument_name);
    if (completer_it == prompt_it->second.end()) {
        return result;
    }

    for (auto& candidate : completer_it->second(partial)) {
        if (starts_with_ignore_case(candidate, partial)) {
            result.values.push_back(std::move(candidate));
        }
    }

    result.total = result.values.size();
    if (result.values.size() > MAX_COMPLETION_VALUES) {
        result.values.resize(MAX_COMPLETION_VALUES);
        result.has_more = true;
    }
    return result;
}

ArgumentCompleter PromptRegistry::static_choices(std::vector<std::string> choices) {
    return [choices = std::move(choices)](const std::string&) {
        return choices;
    };
}

} // namespace mcp_orch
