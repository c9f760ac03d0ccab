#pragma once

#include "registry/PromptRegistry.hpp"
#include "registry/ResourceReader.hpp"
#include "registry/ToolRegistry.hpp"
#include <memory>

namespace mcp_orch {

/**
 * @brief Register the summarize_resource and tool_assistant prompts
 *
 * summarize_resource completes `uri` from the configured resources and
 * `style` from a fixed list. tool_assistant describes the registered tools,
 * so it must be registered after them.
 *
 * @param prompts Registry to populate
 * @param resources Catalog used for URI completion
 * @param tools Registry whose tools are listed in tool_assistant
 */
void register_builtin_prompts(PromptRegistry& prompts,
                              std::shared_ptr<const ResourceReader> resources,
                              std::shared_ptr<const ToolRegistry> tools);

} // namespace mcp_orch
