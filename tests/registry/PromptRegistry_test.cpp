#include "registry/PromptRegistry.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace mcp_orch;
using json = nlohmann::json;

class PromptRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        PromptDefinition greet{
            "greet",
            "Greet someone",
            {
                {"name", "Who to greet", true},
                {"tone", "Greeting tone", false}
            }
        };
        registry.register_prompt(greet, [](const json& args) {
            return json::array({
                {{"role", "user"}, {"content", {{"type", "text"},
                                                {"text", "Say hello to " + args["name"].get<std::string>()}}}}
            });
        });
        registry.register_completer("greet", "tone",
                                    PromptRegistry::static_choices({"Formal", "friendly", "funny"}));
    }

    PromptRegistry registry;
};

TEST_F(PromptRegistryTest, ListsDefinitions) {
    ASSERT_EQ(registry.list().size(), 1u);
    json definition = registry.list()[0].to_json();
    EXPECT_EQ(definition["name"], "greet");
    ASSERT_EQ(definition["arguments"].size(), 2u);
    EXPECT_TRUE(definition["arguments"][0]["required"].get<bool>());
}

TEST_F(PromptRegistryTest, GetBuildsMessages) {
    json result = registry.get("greet", {{"name", "Ada"}});
    EXPECT_EQ(result["description"], "Greet someone");
    ASSERT_EQ(result["messages"].size(), 1u);
    EXPECT_EQ(result["messages"][0]["content"]["text"], "Say hello to Ada");
}

TEST_F(PromptRegistryTest, GetRejectsUnknownPromptAndMissingArguments) {
    EXPECT_THROW(registry.get("missing", json::object()), std::invalid_argument);
    EXPECT_THROW(registry.get("greet", json::object()), std::invalid_argument);
    EXPECT_THROW(registry.get("greet", json::array()), std::invalid_argument);
}

TEST_F(PromptRegistryTest, CompletesByCaseInsensitivePrefix) {
    CompletionValues values = registry.complete("greet", "tone", "f");
    ASSERT_EQ(values.values.size(), 3u);
    EXPECT_EQ(values.values[0], "Formal");

    values = registry.complete("greet", "tone", "FU");
    ASSERT_EQ(values.values.size(), 1u);
    EXPECT_EQ(values.values[0], "funny");
    EXPECT_EQ(values.total, 1u);
    EXPECT_FALSE(values.has_more);
}

TEST_F(PromptRegistryTest, ArgumentWithoutCompleterYieldsNothing) {
    CompletionValues values = registry.complete("greet", "name", "A");
    EXPECT_TRUE(values.values.empty());
    EXPECT_THROW(registry.complete("missing", "x", ""), std::invalid_argument);
}

TEST_F(PromptRegistryTest, CompletionIsCappedAtOneHundred) {
    PromptDefinition pick{"pick", "Pick a number", {{"n", "Number", true}}};
    registry.register_prompt(pick, [](const json&) { return json::array(); });
    registry.register_completer("pick", "n", [](const std::string&) {
        std::vector<std::string> values;
        for (int i = 0; i < 150; ++i) {
            values.push_back("n" + std::to_string(i));
        }
        return values;
    });

    CompletionValues values = registry.complete("pick", "n", "");
    EXPECT_EQ(values.values.size(), PromptRegistry::MAX_COMPLETION_VALUES);
    EXPECT_EQ(values.total, 150u);
    EXPECT_TRUE(values.has_more);

    json rendered = values.to_json();
    EXPECT_TRUE(rendered["hasMore"].get<bool>());
}

TEST_F(PromptRegistryTest, RejectsBadRegistrations) {
    EXPECT_THROW(registry.register_prompt({"greet", "dup", {}}, [](const json&) { return json::array(); }),
                 std::invalid_argument);
    EXPECT_THROW(registry.register_completer("greet", "unknown", PromptRegistry::static_choices({})),
                 std::invalid_argument);
    EXPECT_THROW(registry.register_completer("nope", "tone", PromptRegistry::static_choices({})),
                 std::invalid_argument);
}
