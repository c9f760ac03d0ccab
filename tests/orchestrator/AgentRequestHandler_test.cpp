#include "orchestrator/AgentRequestHandler.hpp"
#include "providers/OpenAIProvider.hpp"
#include "core/Errors.hpp"
#include "mcp/MockHttpClient.hpp"
#include <gtest/gtest.h>

using namespace mcp_orch;
using json = nlohmann::json;

namespace {

json openai_text(const std::string& text) {
    return {
        {"model", "gpt-4o-mini"},
        {"choices", json::array({
            {{"message", {{"role", "assistant"}, {"content", text}}}, {"finish_reason", "stop"}}
        })},
        {"usage", {{"prompt_tokens", 7}, {"completion_tokens", 3}}}
    };
}

json openai_call(const std::string& name, const std::string& arguments) {
    return {
        {"choices", json::array({
            {{"message", {
                {"role", "assistant"},
                {"content", nullptr},
                {"tool_calls", json::array({
                    {{"id", "call_1"}, {"type", "function"},
                     {"function", {{"name", name}, {"arguments", arguments}}}}
                })}
            }}}
        })}
    };
}

} // namespace

class AgentRequestHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        http = std::make_shared<MockHttpClient>();
        auto registry = std::make_shared<ToolRegistry>();
        registry->register_tool({"echo", "Echo", {
            {"type", "object"},
            {"properties", {{"text", {{"type", "string"}}}}},
            {"required", json::array({"text"})}
        }}, [](const json& args) -> json {
            return {{"echoed", args["text"]}};
        });
        registry->register_tool({"lookup", "Pretend document fetch", {
            {"type", "object"},
            {"properties", {{"url", {{"type", "string"}}}}},
            {"required", json::array({"url"})}
        }}, [](const json& args) -> json {
            return {{"url", args["url"]}, {"content", "page"}};
        });

        auto client = std::make_shared<CompletionClient>(std::make_shared<OpenAIProvider>(ProviderConfig()), http);
        auto orchestrator = std::make_shared<ToolCallOrchestrator>(client, registry);

        defaults.system_prompt = "Default system prompt";
        handler = std::make_unique<AgentRequestHandler>(orchestrator, defaults);

        context.headers["Authorization"] = "Bearer sk-request";
    }

    std::shared_ptr<MockHttpClient> http;
    OrchestratorDefaults defaults;
    std::unique_ptr<AgentRequestHandler> handler;
    RequestContext context;
};

TEST_F(AgentRequestHandlerTest, SuccessEnvelope) {
    http->push_json(openai_text("Hello!"));

    json response = handler->handle({{"input", "hi"}, {"mode", "agent"}}, context);

    EXPECT_EQ(response["response"], "Hello!");
    EXPECT_TRUE(response["error"].is_null());
    EXPECT_EQ(response["execution"]["iterations"], 1);
    EXPECT_EQ(response["execution"]["toolsExecuted"], 0);
    EXPECT_FALSE(response["execution"]["maxIterationsReached"].get<bool>());
    EXPECT_TRUE(response["execution"]["toolCalls"].is_array());
    EXPECT_EQ(response["metadata"]["tokensUsed"], 10);
    EXPECT_EQ(response["metadata"]["model"], "gpt-4o-mini");
    EXPECT_TRUE(response["metadata"]["duration"].is_number());

    ASSERT_EQ(http->request_count(), 1u);
    EXPECT_EQ(http->requests()[0].headers.at("Authorization"), "Bearer sk-request");
    json body = http->request_body(0);
    EXPECT_EQ(body["messages"][0]["content"], "Default system prompt");
    EXPECT_EQ(body["messages"][1]["content"], "hi");
}

TEST_F(AgentRequestHandlerTest, SourcesListFetchedUrls) {
    http->push_json(openai_call("lookup", R"({"url":"https://a.test/one"})"));
    http->push_json(openai_call("echo", R"({"text":"between"})"));
    http->push_json(openai_call("lookup", R"({"url":"https://a.test/one"})"));
    http->push_json(openai_call("lookup", R"({"url":"https://a.test/two"})"));
    http->push_json(openai_text("Summary"));

    json response = handler->handle({{"input", "research"}}, context);

    EXPECT_EQ(response["execution"]["toolsExecuted"], 4);
    EXPECT_EQ(response["metadata"]["sources"], json::array({"https://a.test/one", "https://a.test/two"}));
}

TEST_F(AgentRequestHandlerTest, NoSourcesWithoutUrls) {
    http->push_json(openai_call("echo", R"({"text":"x"})"));
    http->push_json(openai_text("done"));

    json response = handler->handle({{"input", "hi"}}, context);

    EXPECT_EQ(response["metadata"]["sources"], json::array());
}

TEST_F(AgentRequestHandlerTest, MissingApiKey) {
    context.headers.clear();

    json response = handler->handle({{"input", "hello"}}, context);

    EXPECT_TRUE(response["response"].is_null());
    EXPECT_EQ(response["errorType"], "AuthenticationError");
    EXPECT_EQ(response["errorCode"], "MISSING_API_KEY");
    EXPECT_EQ(http->request_count(), 0u);
}

TEST_F(AgentRequestHandlerTest, ApiKeyHeaderIsAccepted) {
    context.headers.clear();
    context.headers["X-API-Key"] = "sk-alt";

    EXPECT_EQ(AgentRequestHandler::resolve_api_key(context), "sk-alt");
}

TEST_F(AgentRequestHandlerTest, InvalidInput) {
    json missing = handler->handle({{"mode", "agent"}}, context);
    EXPECT_EQ(missing["errorType"], "ValidationError");
    EXPECT_EQ(missing["errorCode"], "INVALID_INPUT");

    json empty = handler->handle({{"input", ""}}, context);
    EXPECT_EQ(empty["errorCode"], "INVALID_INPUT");

    json wrong_type = handler->handle({{"input", 42}}, context);
    EXPECT_EQ(wrong_type["errorCode"], "INVALID_INPUT");
}

TEST_F(AgentRequestHandlerTest, InvalidOptions) {
    json response = handler->handle({{"input", "hi"}, {"options", {{"maxToolCalls", 0}}}}, context);
    EXPECT_EQ(response["errorType"], "ValidationError");
    EXPECT_EQ(response["errorCode"], "INVALID_OPTIONS");

    response = handler->handle({{"input", "hi"}, {"options", {{"temperature", 5}}}}, context);
    EXPECT_EQ(response["errorCode"], "INVALID_OPTIONS");
}

TEST_F(AgentRequestHandlerTest, OutOfRangeIntegerOptionsAreRejected) {
    const json oversized[] = {
        {{"maxToolCalls", 3000000000LL}},
        {{"maxToolCalls", 4294967297LL}},
        {{"maxToolCalls", 18446744073709551615ULL}},
        {{"maxTokens", 3000000000LL}},
        {{"maxTokens", 4294967297LL}}
    };
    for (const auto& options : oversized) {
        json response = handler->handle({{"input", "hi"}, {"options", options}}, context);
        EXPECT_EQ(response["errorType"], "ValidationError") << options.dump();
        EXPECT_EQ(response["errorCode"], "INVALID_OPTIONS") << options.dump();
    }

    // Values parsed from wire text arrive as unsigned integers
    json parsed = json::parse(R"({"input":"hi","options":{"maxToolCalls":4294967297}})");
    EXPECT_EQ(handler->handle(parsed, context)["errorCode"], "INVALID_OPTIONS");

    EXPECT_EQ(http->request_count(), 0u);
}

TEST_F(AgentRequestHandlerTest, LargestIntOptionIsAccepted) {
    http->push_json(openai_text("ok"));

    json parsed = json::parse(R"({"input":"hi","options":{"maxTokens":2147483647}})");
    json response = handler->handle(parsed, context);

    ASSERT_TRUE(response["error"].is_null());
    EXPECT_EQ(http->request_body(0)["max_tokens"], 2147483647);
}

TEST_F(AgentRequestHandlerTest, OptionsOverrideDefaults) {
    http->push_json(openai_text("ok"));

    json response = handler->handle({
        {"input", "hi"},
        {"options", {
            {"temperature", 0.1},
            {"maxTokens", 64},
            {"model", "gpt-custom"},
            {"systemPrompt", "Custom prompt"}
        }}
    }, context);
    ASSERT_TRUE(response["error"].is_null());

    json body = http->request_body(0);
    EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.1);
    EXPECT_EQ(body["max_tokens"], 64);
    EXPECT_EQ(body["model"], "gpt-custom");
    EXPECT_EQ(body["messages"][0]["content"], "Custom prompt");
}

TEST_F(AgentRequestHandlerTest, HistoryPrecedesInput) {
    http->push_json(openai_text("It is Paris."));

    handler->handle({
        {"input", "And its capital?"},
        {"history", json::array({
            {{"role", "user"}, {"content", "Tell me about France"}},
            {{"role", "assistant"}, {"content", "France is in Europe."}}
        })}
    }, context);

    json messages = http->request_body(0)["messages"];
    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages[1]["content"], "Tell me about France");
    EXPECT_EQ(messages[2]["role"], "assistant");
    EXPECT_EQ(messages[3]["content"], "And its capital?");
}

TEST_F(AgentRequestHandlerTest, BadHistoryIsRejected) {
    json response = handler->handle({
        {"input", "hi"},
        {"history", json::array({{{"role", "tool"}, {"content", "x"}}})}
    }, context);
    EXPECT_EQ(response["errorCode"], "INVALID_HISTORY");
}

TEST_F(AgentRequestHandlerTest, ToolResultsCanBeOmitted) {
    http->push_json(openai_call("echo", R"({"text":"ping"})"));
    http->push_json(openai_text("pong"));
    http->push_json(openai_call("echo", R"({"text":"ping"})"));
    http->push_json(openai_text("pong"));

    json with_results = handler->handle({{"input", "echo ping"}}, context);
    ASSERT_EQ(with_results["execution"]["toolCalls"].size(), 1u);
    EXPECT_EQ(with_results["execution"]["toolCalls"][0]["tool"], "echo");
    EXPECT_EQ(with_results["execution"]["toolCalls"][0]["result"]["echoed"], "ping");
    EXPECT_EQ(with_results["execution"]["toolsExecuted"], 1);

    json without_results = handler->handle(
        {{"input", "echo ping"}, {"options", {{"includeToolResults", false}}}}, context);
    ASSERT_EQ(without_results["execution"]["toolCalls"].size(), 1u);
    EXPECT_FALSE(without_results["execution"]["toolCalls"][0].contains("result"));
    EXPECT_TRUE(without_results["execution"]["toolCalls"][0]["success"].get<bool>());
}

TEST_F(AgentRequestHandlerTest, MaxToolCallsCapsIterations) {
    for (int i = 0; i < 3; ++i) {
        http->push_json(openai_call("echo", R"({"text":"again"})"));
    }

    json response = handler->handle({{"input", "loop"}, {"options", {{"maxToolCalls", 2}}}}, context);

    EXPECT_TRUE(response["execution"]["maxIterationsReached"].get<bool>());
    EXPECT_EQ(response["execution"]["iterations"], 2);
    EXPECT_EQ(response["execution"]["toolsExecuted"], 2);
    EXPECT_EQ(response["response"], ToolCallOrchestrator::max_iterations_message(2));
}

TEST_F(AgentRequestHandlerTest, InspectionMode) {
    http->push_json(openai_call("echo", R"({"text":"x"})"));

    json response = handler->handle({{"input", "hi"}, {"options", {{"autoExecuteTools", false}}}}, context);

    EXPECT_TRUE(response["execution"]["awaitingExecution"].get<bool>());
    EXPECT_EQ(response["execution"]["toolsExecuted"], 0);
    EXPECT_FALSE(response["execution"]["toolCalls"][0]["executed"].get<bool>());
}

TEST_F(AgentRequestHandlerTest, UpstreamFailure) {
    HttpResponse failure;
    failure.status = 401;
    failure.body = R"({"error":{"message":"bad key"}})";
    http->push_response(failure);

    json response = handler->handle({{"input", "hi"}}, context);

    EXPECT_EQ(response["errorType"], "UpstreamProviderError");
    EXPECT_EQ(response["errorCode"], "UPSTREAM_ERROR");
    EXPECT_EQ(response["details"]["status"], 401);
    EXPECT_EQ(response["details"]["body"], R"({"error":{"message":"bad key"}})");
}

TEST_F(AgentRequestHandlerTest, Cancelled) {
    context.cancel.cancel();

    json response = handler->handle({{"input", "hi"}}, context);
    EXPECT_EQ(response["errorType"], "CancelledError");
    EXPECT_EQ(response["errorCode"], "CANCELLED");
}
