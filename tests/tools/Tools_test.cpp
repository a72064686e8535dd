#include "tools/GreetingTool.hpp"
#include "tools/CalculatorTool.hpp"
#include "tools/WeatherTool.hpp"
#include "resources/ConfigResource.hpp"
#include "resources/FileResource.hpp"
#include "prompts/CodeReviewPrompt.hpp"
#include "mcp/McpError.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <functional>

using namespace stdio_mcp;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

ErrorKind kind_of(const std::function<void()>& action) {
    try {
        action();
    } catch (const McpError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "Expected McpError";
    return ErrorKind::Internal;
}

} // namespace

TEST(ToolsTest, GreetingTool_Success) {
    GreetingTool tool;

    CallToolResult result = tool.call({{"name", "Ada"}});

    ASSERT_EQ(result.content.size(), 1);
    EXPECT_EQ(result.content[0].type, "text");
    EXPECT_EQ(result.content[0].text, "Hello, Ada! Welcome to MCP.");
    EXPECT_FALSE(result.is_error.value());
}

TEST(ToolsTest, GreetingTool_MissingParameter) {
    GreetingTool tool;

    EXPECT_EQ(kind_of([&] { tool.call(json::object()); }), ErrorKind::InvalidParams);
    EXPECT_EQ(kind_of([&] { tool.call({{"name", 5}}); }), ErrorKind::InvalidParams);
}

TEST(ToolsTest, CalculatorTool_Bmi) {
    CalculatorTool tool;

    CallToolResult result = tool.call({{"weightKg", 70}, {"heightM", 1.75}});

    ASSERT_EQ(result.content.size(), 1);
    EXPECT_EQ(result.content[0].text, "BMI: 22.86");
    EXPECT_FALSE(result.is_error.value());
}

TEST(ToolsTest, CalculatorTool_NonPositiveHeight) {
    CalculatorTool tool;

    for (double height : {0.0, -1.0}) {
        CallToolResult result = tool.call({{"weightKg", 70}, {"heightM", height}});
        EXPECT_TRUE(result.is_error.value());
        EXPECT_EQ(result.content.at(0).text, "Height must be positive");
    }
}

TEST(ToolsTest, CalculatorTool_InvalidArguments) {
    CalculatorTool tool;

    EXPECT_EQ(kind_of([&] { tool.call({{"heightM", 1.8}}); }), ErrorKind::InvalidParams);
    EXPECT_EQ(kind_of([&] { tool.call({{"weightKg", "70"}, {"heightM", 1.8}}); }), ErrorKind::InvalidParams);
    EXPECT_EQ(kind_of([&] { tool.call(json::array()); }), ErrorKind::InvalidParams);
}

TEST(ToolsTest, WeatherTool_StubData) {
    WeatherTool tool;

    CallToolResult result = tool.call({{"city", "Oslo"}});

    ASSERT_EQ(result.content.size(), 1);
    const std::string& text = result.content[0].text;
    const std::string header = "Weather for Oslo:\n";
    ASSERT_EQ(text.compare(0, header.size(), header), 0);

    json weather = json::parse(text.substr(header.size()));
    EXPECT_EQ(weather["city"], "Oslo");
    EXPECT_EQ(weather["condition"], "Partly Cloudy");
    EXPECT_EQ(kind_of([&] { tool.call(json::object()); }), ErrorKind::InvalidParams);
}

TEST(ToolsTest, ToolInfoSchemas) {
    EXPECT_EQ(GreetingTool::get_info().name, "greet");
    EXPECT_EQ(CalculatorTool::get_info().name, "calculate-bmi");
    EXPECT_EQ(WeatherTool::get_info().name, "fetch-weather");

    json schema = json(CalculatorTool::get_info())["inputSchema"];
    EXPECT_EQ(schema["required"], json::array({"weightKg", "heightM"}));
    EXPECT_EQ(json(WeatherTool::get_info())["annotations"]["openWorldHint"], true);
}

TEST(ResourcesTest, ConfigResource_Read) {
    ConfigResource resource;

    json result = resource.read("config://app");

    ASSERT_EQ(result["contents"].size(), 1);
    const json& item = result["contents"][0];
    EXPECT_EQ(item["uri"], "config://app");
    EXPECT_EQ(item["mimeType"], "application/json");
    EXPECT_FALSE(item.contains("blob"));

    json config = json::parse(item["text"].get<std::string>());
    EXPECT_TRUE(config.contains("appName"));
    EXPECT_EQ(config["features"]["prompts"], true);
}

class FileResourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / "stdio_mcp_file_resource_test";
        fs::remove_all(root_);
        base_ = root_ / "data";
        fs::create_directories(base_ / "nested");

        create_file(base_ / "notes.txt", "hello notes");
        create_file(base_ / "nested" / "values.json", "{\"x\":1}");
        create_file(base_ / "blob.bin", "raw");
        create_file(base_ / "image.png", std::string("\x89PNG\r\n\x1a\n\xff\xfe", 10));
        create_file(base_ / "unicode.txt", "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80");
        create_file(root_ / "secret.txt", "do not serve");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    void create_file(const fs::path& path, const std::string& content) {
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    fs::path root_;
    fs::path base_;
};

TEST_F(FileResourceTest, ReadsTextFile) {
    FileResource resource(base_);

    ResourceReadResult result = resource.read("file:///data/notes.txt");

    ASSERT_EQ(result.contents.size(), 1);
    EXPECT_EQ(result.contents[0].uri, "file:///data/notes.txt");
    EXPECT_EQ(result.contents[0].mime_type, "text/plain");
    EXPECT_EQ(result.contents[0].text.value(), "hello notes");
    EXPECT_EQ(result.contents[0].size.value(), 11u);
}

TEST_F(FileResourceTest, MimeTypeFromExtension) {
    FileResource resource(base_);

    EXPECT_EQ(resource.read("file:///data/nested/values.json").contents[0].mime_type, "application/json");
    EXPECT_EQ(resource.read("file:///data/blob.bin").contents[0].mime_type, "application/octet-stream");
}

TEST_F(FileResourceTest, MultiByteTextIsServed) {
    FileResource resource(base_);

    ResourceReadResult result = resource.read("file:///data/unicode.txt");

    EXPECT_EQ(result.contents[0].text.value(), "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80");
    EXPECT_NO_THROW(json(result).dump());
}

TEST_F(FileResourceTest, BinaryContentIsReadError) {
    FileResource resource(base_);

    try {
        resource.read("file:///data/image.png");
        FAIL() << "Expected binary file to be rejected";
    } catch (const McpError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Internal);
        EXPECT_NE(std::string(e.what()).find("Failed to read file: image.png"), std::string::npos);
    }
}

TEST_F(FileResourceTest, RejectsTraversalAndBadUris) {
    FileResource resource(base_);

    EXPECT_EQ(kind_of([&] { resource.read("file:///data/../secret.txt"); }), ErrorKind::Internal);
    EXPECT_EQ(kind_of([&] { resource.read("file:///data/nested/../../secret.txt"); }), ErrorKind::Internal);
    EXPECT_EQ(kind_of([&] { resource.read("file:///etc/passwd"); }), ErrorKind::Internal);
    EXPECT_EQ(kind_of([&] { resource.read("file:///data/"); }), ErrorKind::Internal);
    EXPECT_EQ(kind_of([&] { resource.read("file:///data/missing.txt"); }), ErrorKind::Internal);
}

TEST(PromptsTest, CodeReviewPrompt_DefaultFocus) {
    CodeReviewPrompt prompt;

    GetPromptResult result = prompt.get(json{{"code", "x = 1"}});

    EXPECT_EQ(result.description.value(), "Requesting general review for code snippet");
    ASSERT_EQ(result.messages.size(), 1);
    EXPECT_EQ(result.messages[0].role, "user");
    const std::string& text = result.messages[0].content.at(0).text;
    EXPECT_EQ(text.find("focusing specifically"), std::string::npos);
    EXPECT_NE(text.find("```\nx = 1\n```"), std::string::npos);
}

TEST(PromptsTest, CodeReviewPrompt_MissingArguments) {
    CodeReviewPrompt prompt;

    EXPECT_EQ(kind_of([&] { prompt.get(std::nullopt); }), ErrorKind::InvalidParams);
    EXPECT_EQ(kind_of([&] { prompt.get(json{{"focus", "style"}}); }), ErrorKind::InvalidParams);
}

TEST(PromptsTest, CodeReviewPrompt_Info) {
    json info = CodeReviewPrompt::get_info();

    EXPECT_EQ(info["name"], "review-code");
    ASSERT_EQ(info["arguments"].size(), 2);
    EXPECT_EQ(info["arguments"][0]["name"], "code");
    EXPECT_EQ(info["arguments"][1]["required"], false);
}
