#include "BuiltinPrompts.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace mcp_orch {

namespace {

json user_message(const std::string& text) {
    return {
        {"role", "user"},
        {"content", {
            {"type", "text"},
            {"text", text}
        }}
    };
}

std::string string_argument(const json& args, const std::string& name, const std::string& fallback) {
    if (!args.contains(name) || args[name].is_null()) {
        return fallback;
    }
    if (!args[name].is_string()) {
        throw std::invalid_argument("Argument " + name + " must be a string");
    }
    return args[name].get<std::string>();
}

std::string style_instruction(const std::string& style) {
    if (style == "brief") {
        return "Write a two or three sentence summary.";
    }
    if (style == "bullet-points") {
        return "Summarize it as a short list of bullet points.";
    }
    if (style == "detailed") {
        return "Write a detailed summary covering every section.";
    }
    throw std::invalid_argument("Unknown style: " + style + " (expected brief, detailed or bullet-points)");
}

} // namespace

void register_builtin_prompts(PromptRegistry& prompts,
                              std::shared_ptr<const ResourceReader> resources,
                              std::shared_ptr<const ToolRegistry> tools) {
    if (!resources || !tools) {
        throw std::invalid_argument("Resource reader and tool registry are required");
    }

    PromptDefinition summarize{
        "summarize_resource",
        "Summarize the content of a resource",
        {
            {"uri", "URI of the resource to summarize", true},
            {"style", "Summary style: brief, detailed or bullet-points", false}
        }
    };
    prompts.register_prompt(summarize, [](const json& args) {
        const std::string uri = string_argument(args, "uri", "");
        const std::string style = string_argument(args, "style", "brief");

        return json::array({
            user_message("Read the resource at " + uri + " (use the fetch_document tool if you need its "
                         "content) and summarize it. " + style_instruction(style))
        });
    });

    prompts.register_completer("summarize_resource", "style",
                               PromptRegistry::static_choices({"brief", "detailed", "bullet-points"}));
    prompts.register_completer("summarize_resource", "uri", [resources](const std::string&) {
        std::vector<std::string> uris;
        for (const auto& descriptor : resources->list()) {
            uris.push_back(descriptor.uri);
        }
        return uris;
    });

    PromptDefinition assistant{
        "tool_assistant",
        "Plan how to complete a task with the server's tools",
        {
            {"task", "Task to accomplish", true}
        }
    };
    prompts.register_prompt(assistant, [tools](const json& args) {
        std::string catalog;
        for (const auto& info : tools->list()) {
            catalog += "- " + info.name + ": " + info.description + "\n";
        }
        if (catalog.empty()) {
            catalog = "(no tools are registered)\n";
        }

        return json::array({
            user_message("You can call these tools:\n" + catalog +
                         "\nTask: " + string_argument(args, "task", "") +
                         "\nDecide which tools to call, in what order, and with which arguments.")
        });
    });
}

} // namespace mcp_orch
