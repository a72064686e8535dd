#include "mcp/HandlerRegistry.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace stdio_mcp;
using json = nlohmann::json;

namespace {

class LabelTool : public IToolHandler {
public:
    explicit LabelTool(std::string label) : label_(std::move(label)) {}

    CallToolResult call(const json&) override {
        return CallToolResult::success({TextContent(label_)});
    }

private:
    std::string label_;
};

class NullResource : public IResourceHandler {
public:
    ResourceReadResult read(const std::string& uri) override {
        ResourceContents contents;
        contents.uri = uri;
        contents.mime_type = "text/plain";
        contents.text = "";
        return {{contents}};
    }
};

class NullPrompt : public IPromptHandler {
public:
    GetPromptResult get(const std::optional<json>&) override {
        return {};
    }
};

ToolInfo tool_info(const std::string& name) {
    return {name, "test tool", {{"type", "object"}}, std::nullopt};
}

std::string label_of(IToolHandler& tool) {
    return tool.call(json::object()).content.at(0).text;
}

} // namespace

TEST(HandlerRegistryTest, EmptyRegistry) {
    HandlerRegistry registry;

    EXPECT_EQ(registry.find_tool("anything"), nullptr);
    EXPECT_EQ(registry.find_resource("config://app"), nullptr);
    EXPECT_EQ(registry.find_prompt("anything"), nullptr);
    EXPECT_TRUE(registry.list_tools().empty());
    EXPECT_EQ(registry.size(HandlerGroup::Tools), 0);
}

TEST(HandlerRegistryTest, RejectsEmptyNamesAndNullHandlers) {
    HandlerRegistry registry;

    EXPECT_THROW(registry.register_tool(tool_info(""), std::make_shared<LabelTool>("x")), std::invalid_argument);
    EXPECT_THROW(registry.register_tool(tool_info("t"), nullptr), std::invalid_argument);
    EXPECT_THROW(registry.register_resource(ResourceInfo{}, std::make_shared<NullResource>()), std::invalid_argument);
    EXPECT_THROW(registry.register_prompt(PromptInfo{}, std::make_shared<NullPrompt>()), std::invalid_argument);
}

TEST(HandlerRegistryTest, LastRegistrationWins) {
    HandlerRegistry registry;
    auto first = std::make_shared<LabelTool>("first");
    auto second = std::make_shared<LabelTool>("second");

    registry.register_tool(tool_info("dup"), first);
    registry.register_tool(tool_info("dup"), second);

    EXPECT_EQ(registry.size(HandlerGroup::Tools), 1);
    auto found = registry.find_tool("dup");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(label_of(*found), "second");
}

TEST(HandlerRegistryTest, ReplacedHandlerOutlivesLookup) {
    HandlerRegistry registry;
    registry.register_tool(tool_info("t"), std::make_shared<LabelTool>("old"));

    auto held = registry.find_tool("t");
    registry.register_tool(tool_info("t"), std::make_shared<LabelTool>("new"));

    EXPECT_EQ(label_of(*held), "old");
    EXPECT_EQ(label_of(*registry.find_tool("t")), "new");
}

TEST(HandlerRegistryTest, GroupsAreSeparateNamespaces) {
    HandlerRegistry registry;
    registry.register_tool(tool_info("shared"), std::make_shared<LabelTool>("tool"));
    registry.register_prompt({"shared", "prompt", std::nullopt}, std::make_shared<NullPrompt>());

    EXPECT_NE(registry.find_tool("shared"), nullptr);
    EXPECT_NE(registry.find_prompt("shared"), nullptr);
    EXPECT_EQ(registry.size(HandlerGroup::Tools), 1);
    EXPECT_EQ(registry.size(HandlerGroup::Prompts), 1);
    EXPECT_EQ(registry.size(HandlerGroup::Resources), 0);
}

TEST(HandlerRegistryTest, ResourcesMatchedByScheme) {
    HandlerRegistry registry;
    auto config = std::make_shared<NullResource>();
    auto files = std::make_shared<NullResource>();
    registry.register_resource({"config", "config://app", "Config", "App config", "application/json"}, config);
    registry.register_resource({"file", "", "Files", "Data files", "application/octet-stream"}, files);

    EXPECT_EQ(registry.find_resource("config://app"), config);
    EXPECT_EQ(registry.find_resource("config://other"), config);
    EXPECT_EQ(registry.find_resource("file:///data/a.txt"), files);
    EXPECT_EQ(registry.find_resource("configx://app"), nullptr);
    EXPECT_EQ(registry.find_resource("config:/app"), nullptr);

    // Unlisted resources stay routable
    auto listed = registry.list_resources();
    ASSERT_EQ(listed.size(), 1);
    EXPECT_EQ(listed[0].uri, "config://app");
}

TEST(HandlerRegistryTest, SchemeOf) {
    EXPECT_EQ(HandlerRegistry::scheme_of("config://app"), "config");
    EXPECT_EQ(HandlerRegistry::scheme_of("file:///data/x"), "file");
    EXPECT_EQ(HandlerRegistry::scheme_of("plain"), "");
    EXPECT_EQ(HandlerRegistry::scheme_of("://nothing"), "");
}

TEST(HandlerRegistryTest, ListingsSortedByName) {
    HandlerRegistry registry;
    registry.register_tool(tool_info("zeta"), std::make_shared<LabelTool>("z"));
    registry.register_tool(tool_info("alpha"), std::make_shared<LabelTool>("a"));

    auto tools = registry.list_tools();
    ASSERT_EQ(tools.size(), 2);
    EXPECT_EQ(tools[0].name, "alpha");
    EXPECT_EQ(tools[1].name, "zeta");
}

TEST(HandlerRegistryTest, ConcurrentRegisterAndLookup) {
    HandlerRegistry registry;
    auto a = std::make_shared<LabelTool>("a");
    auto b = std::make_shared<LabelTool>("b");
    registry.register_tool(tool_info("flip"), a);

    std::atomic<bool> done{false};
    std::atomic<int> bad_lookups{0};

    std::thread writer([&] {
        for (int i = 0; i < 2000; ++i) {
            registry.register_tool(tool_info("flip"), (i % 2) ? a : b);
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!done) {
                auto found = registry.find_tool("flip");
                if (found != a && found != b) {
                    ++bad_lookups;
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(bad_lookups, 0);
    EXPECT_EQ(registry.size(HandlerGroup::Tools), 1);
}
