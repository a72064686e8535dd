#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stdio_mcp {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;               // JSON Schema for tool arguments
    std::optional<json> annotations; // title, readOnlyHint, ...
};

/**
 * @brief Metadata for an MCP resource
 *
 * Resources are routed by URI scheme. A resource with an empty uri is
 * readable but not advertised by resources/list.
 */
struct ResourceInfo {
    std::string scheme;   // e.g. "config" for config://app
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

struct PromptArgument {
    std::string name;
    std::string description;
    std::optional<bool> required;
};

/**
 * @brief Metadata for an MCP prompt template
 */
struct PromptInfo {
    std::string name;
    std::string description;
    std::optional<std::vector<PromptArgument>> arguments;
};

/**
 * @brief Text content item ({"type": "text", "text": ...})
 */
struct TextContent {
    std::string type = "text";
    std::string text;

    TextContent() = default;
    explicit TextContent(std::string value) : text(std::move(value)) {}
};

/**
 * @brief Result of tools/call
 *
 * is_error reports a business failure inside a successful response;
 * protocol failures are raised as McpError instead.
 */
struct CallToolResult {
    std::vector<TextContent> content;
    std::optional<bool> is_error;

    static CallToolResult success(std::vector<TextContent> content);
    static CallToolResult error(const std::string& message);
};

/**
 * @brief One item of a resources/read result
 */
struct ResourceContents {
    std::string uri;
    std::string mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64 encoded
    std::optional<std::uint64_t> size;
};

struct ResourceReadResult {
    std::vector<ResourceContents> contents;
};

struct PromptMessage {
    std::string role;
    std::vector<TextContent> content;
};

/**
 * @brief Result of prompts/get
 */
struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;
};

/**
 * @brief Callable action exposed through tools/call
 */
class IToolHandler {
public:
    virtual ~IToolHandler() = default;

    /**
     * @brief Execute the tool
     * @param arguments JSON object with tool arguments ({} when omitted)
     * @throws McpError on invalid arguments or domain failure
     */
    virtual CallToolResult call(const json& arguments) = 0;
};

/**
 * @brief Readable resource exposed through resources/read
 */
class IResourceHandler {
public:
    virtual ~IResourceHandler() = default;

    /**
     * @brief Read the resource identified by uri
     * @throws McpError when the resource cannot be read
     */
    virtual ResourceReadResult read(const std::string& uri) = 0;
};

/**
 * @brief Prompt template exposed through prompts/get
 */
class IPromptHandler {
public:
    virtual ~IPromptHandler() = default;

    /**
     * @brief Render the prompt
     * @param arguments Arguments object, or nullopt when the client sent none
     * @throws McpError on missing or invalid arguments
     */
    virtual GetPromptResult get(const std::optional<json>& arguments) = 0;
};

void to_json(json& j, const ToolInfo& info);
void to_json(json& j, const ResourceInfo& info);
void to_json(json& j, const PromptArgument& argument);
void to_json(json& j, const PromptInfo& info);
void to_json(json& j, const TextContent& content);
void to_json(json& j, const CallToolResult& result);
void to_json(json& j, const ResourceContents& contents);
void to_json(json& j, const ResourceReadResult& result);
void to_json(json& j, const PromptMessage& message);
void to_json(json& j, const GetPromptResult& result);

} // namespace stdio_mcp
