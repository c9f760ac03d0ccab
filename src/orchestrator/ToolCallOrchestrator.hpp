#pragma once

#include "core/CancellationToken.hpp"
#include "providers/CompletionClient.hpp"
#include "providers/Transcript.hpp"
#include "registry/ToolRegistry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mcp_orch {

/**
 * @brief Settings for one orchestration run
 */
struct OrchestrationOptions {
    bool auto_execute_tools = true;
    int max_iterations = 10;
    double temperature = 0.7;
    int max_tokens = 1024;
    std::string model;  // Empty means the provider's configured model
};

/**
 * @brief Outcome of an orchestration run
 */
struct OrchestrationResult {
    std::string response;
    std::vector<ToolCallRecord> tool_calls;  // Audit trail, in execution order
    int tools_executed = 0;
    int iterations = 0;                      // Completion calls made
    bool max_iterations_reached = false;
    bool awaiting_execution = false;         // Inspection mode stopped at proposed calls
    TokenUsage usage;
    std::string model;
};

/**
 * @brief Bounded completion -> tool execution -> completion loop
 *
 * Stateless between runs: each run() owns its transcript and audit trail.
 * Tool calls from one response are executed sequentially in the order the
 * model issued them, and a failing call is recorded without aborting its
 * siblings. Provider failures abort the run.
 */
class ToolCallOrchestrator {
public:
    ToolCallOrchestrator(std::shared_ptr<CompletionClient> client,
                         std::shared_ptr<const ToolRegistry> registry);

    /**
     * @brief Run the loop over a prepared transcript
     * @param transcript Initial messages; consumed by the run
     * @param options Loop and generation settings
     * @param api_key Provider credential
     * @param cancel Checked before every completion call
     * @throws UpstreamProviderError, CancelledError
     */
    OrchestrationResult run(Transcript transcript,
                            const OrchestrationOptions& options,
                            const std::string& api_key,
                            const CancellationToken& cancel) const;

    /**
     * @brief Sentinel response returned when the iteration cap is hit
     */
    static std::string max_iterations_message(int max_iterations);

private:
    ToolCallRecord execute_call(const ToolCallRequest& call) const;

    std::shared_ptr<CompletionClient> client_;
    std::shared_ptr<const ToolRegistry> registry_;
};

} // namespace mcp_orch
