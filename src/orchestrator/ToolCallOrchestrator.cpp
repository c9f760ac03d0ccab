#include "orchestrator/ToolCallOrchestrator.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_orch {

ToolCallOrchestrator::ToolCallOrchestrator(std::shared_ptr<CompletionClient> client,
                                           std::shared_ptr<const ToolRegistry> registry)
    : client_(std::move(client)), registry_(std::move(registry)) {
    if (!client_) {
        throw std::invalid_argument("Completion client cannot be null");
    }
    if (!registry_) {
        throw std::invalid_argument("Tool registry cannot be null");
    }
}

std::string ToolCallOrchestrator::max_iterations_message(int max_iterations) {
    return "Maximum tool-call iterations reached (" + std::to_string(max_iterations) +
           ") without a final answer.";
}

ToolCallRecord ToolCallOrchestrator::execute_call(const ToolCallRequest& call) const {
    ToolCallRecord record;
    record.id = call.id;
    record.name = call.name;
    record.arguments = call.arguments;

    try {
        record.result = registry_->execute(call.name, call.arguments);
        record.success = true;
    } catch (const ToolNotFoundError& e) {
        record.error = e.what();
        record.error_type = "not_found";
    } catch (const ToolError& e) {
        record.error = e.what();
        record.error_type = std::string(to_string(e.kind()));
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        record.error = e.what();
        record.error_type = std::string(to_string(ToolErrorKind::UNEXPECTED));
    }

    if (record.success) {
        spdlog::debug("Tool {} ({}) succeeded", call.name, call.id);
    } else {
        spdlog::warn("Tool {} ({}) failed: {}", call.name, call.id, record.error);
    }
    return record;
}

OrchestrationResult ToolCallOrchestrator::run(Transcript transcript,
                                              const OrchestrationOptions& options,
                                              const std::string& api_key,
                                              const CancellationToken& cancel) const {
    if (options.max_iterations < 1) {
        throw std::invalid_argument("max_iterations must be at least 1");
    }

    const IProvider& provider = client_->provider();
    const GenerationParams params{options.temperature, options.max_tokens, options.model};

    OrchestrationResult outcome;
    outcome.model = options.model.empty() ? provider.default_model() : options.model;

    while (outcome.iterations < options.max_iterations) {
        if (cancel.is_cancelled()) {
            throw CancelledError("Orchestration cancelled");
        }

        CompletionResult completion = client_->complete(transcript, registry_->list(), params, api_key, cancel);
        ++outcome.iterations;
        outcome.usage += completion.usage;
        if (!completion.model.empty()) {
            outcome.model = completion.model;
        }

        if (!completion.has_tool_calls()) {
            outcome.response = completion.text;
            spdlog::info("Orchestration finished after {} iteration(s), {} tool call(s)",
                         outcome.iterations, outcome.tools_executed);
            return outcome;
        }

        if (!options.auto_execute_tools) {
            for (const auto& call : completion.tool_calls) {
                ToolCallRecord proposed;
                proposed.id = call.id;
                proposed.name = call.name;
                proposed.arguments = call.arguments;
                proposed.executed = false;
                outcome.tool_calls.push_back(std::move(proposed));
            }
            outcome.response = completion.text;
            outcome.awaiting_execution = true;
            spdlog::info("Auto-execution disabled, returning {} proposed tool call(s)",
                         completion.tool_calls.size());
            return outcome;
        }

        transcript.append(provider.assistant_message(completion));

        std::vector<ToolCallRecord> batch;
        batch.reserve(completion.tool_calls.size());
        for (const auto& call : completion.tool_calls) {
            if (call.arguments_malformed) {
                spdlog::warn("Tool call {} ({}) had malformed arguments, using {{}}", call.name, call.id);
            }
            batch.push_back(execute_call(call));
        }

        for (auto& message : provider.tool_result_messages(batch)) {
            transcript.append(std::move(message));
        }

        outcome.tools_executed += static_cast<int>(batch.size());
        for (auto& record : batch) {
            outcome.tool_calls.push_back(std::move(record));
        }
    }

    spdlog::warn("Orchestration hit the iteration cap ({}) with {} tool call(s)",
                 options.max_iterations, outcome.tools_executed);
    outcome.response = max_iterations_message(options.max_iterations);
    outcome.max_iterations_reached = true;
    return outcome;
}

} // namespace mcp_orch
