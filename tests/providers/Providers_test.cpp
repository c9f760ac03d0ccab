#include "providers/AnthropicProvider.hpp"
#include "providers/AzureOpenAIProvider.hpp"
#include "providers/OpenAIProvider.hpp"
#include "providers/ProviderFactory.hpp"
#include "core/Errors.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace mcp_orch;
using json = nlohmann::json;

namespace {

std::vector<ToolInfo> sample_tools() {
    return {
        {"get_weather", "Current weather", {
            {"type", "object"},
            {"properties", {{"location", {{"type", "string"}}}}},
            {"required", json::array({"location"})}
        }},
        {"no_schema", "Tool without schema", json()}
    };
}

Transcript sample_transcript() {
    Transcript transcript;
    transcript.add_system("Be brief.");
    transcript.add_user("Weather in Paris?");
    return transcript;
}

ProviderConfig config_for(ProviderKind kind) {
    ProviderConfig config;
    config.kind = kind;
    if (kind == ProviderKind::AZURE_OPENAI) {
        config.base_url = "https://res.openai.azure.com/";
        config.model = "gpt4-deploy";
    } else if (kind == ProviderKind::ANTHROPIC) {
        config.model = "claude-test";
    }
    return config;
}

} // namespace

// ============================================================================
// OpenAI
// ============================================================================

TEST(OpenAIProviderTest, TranslatesToolsToFunctionFormat) {
    OpenAIProvider provider(config_for(ProviderKind::OPENAI));
    json tools = provider.translate_tools(sample_tools());

    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["type"], "function");
    EXPECT_EQ(tools[0]["function"]["name"], "get_weather");
    EXPECT_EQ(tools[0]["function"]["parameters"]["required"][0], "location");
    EXPECT_EQ(tools[1]["function"]["parameters"]["type"], "object");
}

TEST(OpenAIProviderTest, BuildsChatCompletionsRequest) {
    OpenAIProvider provider(config_for(ProviderKind::OPENAI));
    GenerationParams params{0.2, 256, ""};

    HttpRequest request = provider.build_request(sample_transcript(),
                                                 provider.translate_tools(sample_tools()), params, "sk-test");

    EXPECT_EQ(request.url, "https://api.openai.com/v1/chat/completions");
    EXPECT_EQ(request.headers.at("Authorization"), "Bearer sk-test");

    json body = json::parse(request.body);
    EXPECT_EQ(body["model"], "gpt-4o-mini");
    EXPECT_EQ(body["max_tokens"], 256);
    EXPECT_EQ(body["tool_choice"], "auto");
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "system");
}

TEST(OpenAIProviderTest, OmitsToolsWhenNoneRegistered) {
    OpenAIProvider provider(config_for(ProviderKind::OPENAI));
    HttpRequest request = provider.build_request(sample_transcript(), json::array(), GenerationParams{}, "k");

    json body = json::parse(request.body);
    EXPECT_FALSE(body.contains("tools"));
    EXPECT_FALSE(body.contains("tool_choice"));
}

TEST(OpenAIProviderTest, ParsesToolCallsAndUsage) {
    OpenAIProvider provider(config_for(ProviderKind::OPENAI));
    json body = {
        {"model", "gpt-4o-mini-2024"},
        {"choices", json::array({
            {{"finish_reason", "tool_calls"},
             {"message", {
                {"role", "assistant"},
                {"content", nullptr},
                {"tool_calls", json::array({
                    {{"id", "call_a"}, {"type", "function"},
                     {"function", {{"name", "get_weather"}, {"arguments", R"({"location":"Paris"})"}}}},
                    {{"type", "function"},
                     {"function", {{"name", "get_weather"}, {"arguments", "{not json"}}}}
                })}
             }}}
        })},
        {"usage", {{"prompt_tokens", 12}, {"completion_tokens", 5}}}
    };

    CompletionResult result = provider.parse_response(body);

    EXPECT_EQ(result.text, "");
    EXPECT_EQ(result.model, "gpt-4o-mini-2024");
    EXPECT_EQ(result.stop_reason, "tool_calls");
    EXPECT_EQ(result.usage.total(), 17);
    ASSERT_EQ(result.tool_calls.size(), 2u);
    EXPECT_EQ(result.tool_calls[0].id, "call_a");
    EXPECT_EQ(result.tool_calls[0].arguments["location"], "Paris");
    EXPECT_FALSE(result.tool_calls[0].arguments_malformed);

    // Malformed arguments degrade to an empty object
    EXPECT_EQ(result.tool_calls[1].id, "call_2");
    EXPECT_EQ(result.tool_calls[1].arguments, json::object());
    EXPECT_TRUE(result.tool_calls[1].arguments_malformed);
}

TEST(OpenAIProviderTest, MissingChoicesIsUpstreamError) {
    OpenAIProvider provider(config_for(ProviderKind::OPENAI));
    EXPECT_THROW(provider.parse_response({{"error", "nope"}}), UpstreamProviderError);
    EXPECT_THROW(provider.parse_response({{"choices", json::array({{{"index", 0}}})}}), UpstreamProviderError);
}

TEST(OpenAIProviderTest, EchoesAssistantTurnAndToolResults) {
    OpenAIProvider provider(config_for(ProviderKind::OPENAI));

    CompletionResult result;
    ToolCallRequest call;
    call.id = "call_1";
    call.name = "get_weather";
    call.arguments = {{"location", "Paris"}};
    call.raw_arguments = R"({"location":"Paris"})";
    result.tool_calls.push_back(call);

    json assistant = provider.assistant_message(result);
    EXPECT_EQ(assistant["role"], "assistant");
    EXPECT_TRUE(assistant["content"].is_null());
    EXPECT_EQ(assistant["tool_calls"][0]["function"]["arguments"], R"({"location":"Paris"})");

    ToolCallRecord ok;
    ok.id = "call_1";
    ok.success = true;
    ok.result = {{"temp", 20}};
    ToolCallRecord failed;
    failed.id = "call_2";
    failed.error = "boom";
    failed.error_type = "network";

    auto messages = provider.tool_result_messages({ok, failed});
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0]["role"], "tool");
    EXPECT_EQ(messages[0]["tool_call_id"], "call_1");
    EXPECT_EQ(json::parse(messages[0]["content"].get<std::string>())["temp"], 20);
    EXPECT_EQ(json::parse(messages[1]["content"].get<std::string>())["error"], "boom");
}

TEST(OpenAIProviderTest, EchoedAssistantTurnKeepsProviderFields) {
    OpenAIProvider provider(config_for(ProviderKind::OPENAI));
    json body = {
        {"choices", json::array({
            {{"message", {
                {"role", "assistant"},
                {"content", "Checking."},
                {"refusal", nullptr},
                {"annotations", json::array({{{"type", "note"}}})},
                {"tool_calls", json::array({
                    {{"type", "function"},
                     {"function", {{"name", "get_weather"}, {"arguments", "{not json"}}}}
                })}
            }}}
        })}
    };

    CompletionResult result = provider.parse_response(body);
    json assistant = provider.assistant_message(result);

    EXPECT_EQ(assistant["role"], "assistant");
    EXPECT_EQ(assistant["content"], "Checking.");
    EXPECT_TRUE(assistant.contains("refusal"));
    EXPECT_EQ(assistant["annotations"][0]["type"], "note");
    ASSERT_EQ(assistant["tool_calls"].size(), 1u);
    EXPECT_EQ(assistant["tool_calls"][0]["id"], "call_1");
    EXPECT_EQ(assistant["tool_calls"][0]["function"]["arguments"], "{}");
}

// ============================================================================
// Azure OpenAI
// ============================================================================

TEST(AzureOpenAIProviderTest, UsesDeploymentUrlAndApiKeyHeader) {
    AzureOpenAIProvider provider(config_for(ProviderKind::AZURE_OPENAI));

    HttpRequest request = provider.build_request(sample_transcript(), json::array(), GenerationParams{}, "az-key");

    EXPECT_EQ(request.url,
              "https://res.openai.azure.com/openai/deployments/gpt4-deploy/chat/completions?api-version=2024-06-01");
    EXPECT_EQ(request.headers.at("api-key"), "az-key");
    EXPECT_EQ(request.headers.count("Authorization"), 0u);
    EXPECT_FALSE(json::parse(request.body).contains("model"));
}

TEST(AzureOpenAIProviderTest, RequiresBaseUrl) {
    ProviderConfig config;
    config.kind = ProviderKind::AZURE_OPENAI;
    EXPECT_THROW(AzureOpenAIProvider provider(config), std::invalid_argument);
}

// ============================================================================
// Anthropic
// ============================================================================

TEST(AnthropicProviderTest, TranslatesToolsWithInputSchema) {
    AnthropicProvider provider(config_for(ProviderKind::ANTHROPIC));
    json tools = provider.translate_tools(sample_tools());

    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["name"], "get_weather");
    EXPECT_TRUE(tools[0].contains("input_schema"));
    EXPECT_FALSE(tools[0].contains("function"));
}

TEST(AnthropicProviderTest, LiftsSystemMessagesIntoSystemField) {
    AnthropicProvider provider(config_for(ProviderKind::ANTHROPIC));
    Transcript transcript = sample_transcript();
    transcript.add_system("Answer in English.");

    HttpRequest request = provider.build_request(transcript, provider.translate_tools(sample_tools()),
                                                 GenerationParams{}, "ant-key");

    EXPECT_EQ(request.url, "https://api.anthropic.com/v1/messages");
    EXPECT_EQ(request.headers.at("x-api-key"), "ant-key");
    EXPECT_EQ(request.headers.at("anthropic-version"), "2023-06-01");

    json body = json::parse(request.body);
    EXPECT_EQ(body["system"], "Be brief.\n\nAnswer in English.");
    ASSERT_EQ(body["messages"].size(), 1u);
    EXPECT_EQ(body["messages"][0]["role"], "user");
    EXPECT_EQ(body["model"], "claude-test");
    EXPECT_EQ(body["tools"].size(), 2u);
}

TEST(AnthropicProviderTest, BaseUrlEndingInV1IsNotDoubled) {
    ProviderConfig config = config_for(ProviderKind::ANTHROPIC);
    config.base_url = "https://gateway.example.com/v1";
    AnthropicProvider provider(config);

    HttpRequest request = provider.build_request(sample_transcript(), json::array(), GenerationParams{}, "k");
    EXPECT_EQ(request.url, "https://gateway.example.com/v1/messages");
}

TEST(AnthropicProviderTest, ParsesTextAndToolUseBlocks) {
    AnthropicProvider provider(config_for(ProviderKind::ANTHROPIC));
    json body = {
        {"model", "claude-test"},
        {"stop_reason", "tool_use"},
        {"content", json::array({
            {{"type", "text"}, {"text", "Let me check."}},
            {{"type", "tool_use"}, {"id", "toolu_1"}, {"name", "get_weather"}, {"input", {{"location", "Oslo"}}}}
        })},
        {"usage", {{"input_tokens", 30}, {"output_tokens", 8}}}
    };

    CompletionResult result = provider.parse_response(body);

    EXPECT_EQ(result.text, "Let me check.");
    EXPECT_EQ(result.usage.prompt_tokens, 30);
    EXPECT_EQ(result.usage.completion_tokens, 8);
    ASSERT_EQ(result.tool_calls.size(), 1u);
    EXPECT_EQ(result.tool_calls[0].id, "toolu_1");
    EXPECT_EQ(result.tool_calls[0].arguments["location"], "Oslo");

    json assistant = provider.assistant_message(result);
    ASSERT_EQ(assistant["content"].size(), 2u);
    EXPECT_EQ(assistant["content"][1]["type"], "tool_use");
}

TEST(AnthropicProviderTest, ToolResultsShareOneUserMessage) {
    AnthropicProvider provider(config_for(ProviderKind::ANTHROPIC));

    ToolCallRecord ok;
    ok.id = "toolu_1";
    ok.success = true;
    ok.result = "sunny";
    ToolCallRecord failed;
    failed.id = "toolu_2";
    failed.error = "not found";
    failed.error_type = "not_found";

    auto messages = provider.tool_result_messages({ok, failed});
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0]["role"], "user");

    const json& blocks = messages[0]["content"];
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0]["type"], "tool_result");
    EXPECT_EQ(blocks[0]["tool_use_id"], "toolu_1");
    EXPECT_EQ(blocks[0]["content"], "sunny");
    EXPECT_FALSE(blocks[0].contains("is_error"));
    EXPECT_TRUE(blocks[1]["is_error"].get<bool>());
}

TEST(AnthropicProviderTest, MissingContentIsUpstreamError) {
    AnthropicProvider provider(config_for(ProviderKind::ANTHROPIC));
    EXPECT_THROW(provider.parse_response({{"type", "error"}}), UpstreamProviderError);
}

TEST(AnthropicProviderTest, AssistantTurnEchoesBlocksInOrder) {
    AnthropicProvider provider(config_for(ProviderKind::ANTHROPIC));
    json body = {
        {"content", json::array({
            {{"type", "thinking"}, {"thinking", "Need the forecast."}, {"signature", "sig"}},
            {{"type", "tool_use"}, {"id", "toolu_1"}, {"name", "get_weather"}, {"input", {{"location", "Oslo"}}}},
            {{"type", "text"}, {"text", "One moment."}},
            {{"type", "tool_use"}, {"name", "get_weather"}, {"input", "{bad"}}
        })}
    };

    CompletionResult result = provider.parse_response(body);
    ASSERT_EQ(result.tool_calls.size(), 2u);

    json assistant = provider.assistant_message(result);
    EXPECT_EQ(assistant["role"], "assistant");

    const json& content = assistant["content"];
    ASSERT_EQ(content.size(), 4u);
    EXPECT_EQ(content[0]["type"], "thinking");
    EXPECT_EQ(content[0]["signature"], "sig");
    EXPECT_EQ(content[1]["type"], "tool_use");
    EXPECT_EQ(content[1]["id"], "toolu_1");
    EXPECT_EQ(content[1]["input"]["location"], "Oslo");
    EXPECT_EQ(content[2]["type"], "text");
    EXPECT_EQ(content[2]["text"], "One moment.");

    // Generated id and empty input match the tool_result that follows
    EXPECT_EQ(content[3]["id"], result.tool_calls[1].id);
    EXPECT_EQ(content[3]["id"], "toolu_2");
    EXPECT_EQ(content[3]["input"], json::object());
}

TEST(AnthropicProviderTest, AssistantTurnIsRebuiltWithoutRawContent) {
    AnthropicProvider provider(config_for(ProviderKind::ANTHROPIC));

    CompletionResult result;
    result.text = "Let me check.";
    ToolCallRequest call;
    call.id = "toolu_9";
    call.name = "get_weather";
    call.arguments = {{"location", "Rome"}};
    result.tool_calls.push_back(call);

    json content = provider.assistant_message(result)["content"];
    ASSERT_EQ(content.size(), 2u);
    EXPECT_EQ(content[0]["type"], "text");
    EXPECT_EQ(content[1]["type"], "tool_use");
    EXPECT_EQ(content[1]["id"], "toolu_9");
}

TEST(AnthropicProviderTest, NonUtf8ToolOutputIsReplacedNotRejected) {
    AnthropicProvider provider(config_for(ProviderKind::ANTHROPIC));

    ToolCallRecord record;
    record.id = "toolu_1";
    record.success = true;
    record.result = {{"content", "caf\xe9"}};

    std::vector<json> messages;
    ASSERT_NO_THROW(messages = provider.tool_result_messages({record}));
    ASSERT_EQ(messages.size(), 1u);
    const std::string text = messages[0]["content"][0]["content"].get<std::string>();
    EXPECT_NE(text.find("caf\xEF\xBF\xBD"), std::string::npos);

    Transcript transcript = sample_transcript();
    transcript.append(messages[0]);
    ToolCallRecord raw = record;
    raw.result = "caf\xe9";
    transcript.append(provider.tool_result_messages({raw})[0]);

    HttpRequest request;
    ASSERT_NO_THROW(request = provider.build_request(transcript, json::array(), GenerationParams{}, "k"));
    json body = json::parse(request.body);
    EXPECT_EQ(body["messages"].back()["content"][0]["content"], "caf\xEF\xBF\xBD");
}

TEST(OpenAIProviderTest, NonUtf8TranscriptSerializesWithReplacement) {
    OpenAIProvider provider(config_for(ProviderKind::OPENAI));

    ToolCallRecord record;
    record.id = "call_1";
    record.success = true;
    record.result = "caf\xe9";

    Transcript transcript = sample_transcript();
    transcript.append(provider.tool_result_messages({record})[0]);

    HttpRequest request;
    ASSERT_NO_THROW(request = provider.build_request(transcript, json::array(), GenerationParams{}, "k"));
    json body = json::parse(request.body);
    EXPECT_EQ(body["messages"].back()["role"], "tool");
    EXPECT_EQ(body["messages"].back()["content"], "caf\xEF\xBF\xBD");
}

// ============================================================================
// Factory and shared helpers
// ============================================================================

TEST(ProviderFactoryTest, SelectsVariantByKind) {
    EXPECT_EQ(make_provider(config_for(ProviderKind::OPENAI))->kind(), ProviderKind::OPENAI);
    EXPECT_EQ(make_provider(config_for(ProviderKind::AZURE_OPENAI))->kind(), ProviderKind::AZURE_OPENAI);
    EXPECT_EQ(make_provider(config_for(ProviderKind::ANTHROPIC))->kind(), ProviderKind::ANTHROPIC);
}

TEST(ToolArgumentsTest, MalformedPayloadsBecomeEmptyObject) {
    bool malformed = false;

    EXPECT_EQ(parse_tool_arguments(R"({"a":1})", malformed)["a"], 1);
    EXPECT_FALSE(malformed);

    EXPECT_EQ(parse_tool_arguments("{oops", malformed), json::object());
    EXPECT_TRUE(malformed);

    EXPECT_EQ(parse_tool_arguments("[1,2]", malformed), json::object());
    EXPECT_TRUE(malformed);

    EXPECT_EQ(parse_tool_arguments(json(), malformed), json::object());
    EXPECT_FALSE(malformed);
}
