#include "Handlers.hpp"

namespace stdio_mcp {

CallToolResult CallToolResult::success(std::vector<TextContent> content) {
    CallToolResult result;
    result.content = std::move(content);
    result.is_error = false;
    return result;
}

CallToolResult CallToolResult::error(const std::string& message) {
    CallToolResult result;
    result.content.emplace_back(message);
    result.is_error = true;
    return result;
}

void to_json(json& j, const ToolInfo& info) {
    j = {
        {"name", info.name},
        {"description", info.description},
        {"inputSchema", info.input_schema}
    };
    if (info.annotations) {
        j["annotations"] = *info.annotations;
    }
}

void to_json(json& j, const ResourceInfo& info) {
    j = {
        {"uri", info.uri},
        {"name", info.name},
        {"description", info.description},
        {"mimeType", info.mime_type}
    };
}

void to_json(json& j, const PromptArgument& argument) {
    j = {
        {"name", argument.name},
        {"description", argument.description}
    };
    if (argument.required) {
        j["required"] = *argument.required;
    }
}

void to_json(json& j, const PromptInfo& info) {
    j = {
        {"name", info.name},
        {"description", info.description}
    };
    if (info.arguments) {
        j["arguments"] = *info.arguments;
    }
}

void to_json(json& j, const TextContent& content) {
    j = {
        {"type", content.type},
        {"text", content.text}
    };
}

void to_json(json& j, const CallToolResult& result) {
    j = {{"content", result.content}};
    if (result.is_error) {
        j["isError"] = *result.is_error;
    }
}

void to_json(json& j, const ResourceContents& contents) {
    j = {
        {"uri", contents.uri},
        {"mimeType", contents.mime_type}
    };
    if (contents.text) {
        j["text"] = *contents.text;
    }
    if (contents.blob) {
        j["blob"] = *contents.blob;
    }
    if (contents.size) {
        j["size"] = *contents.size;
    }
}

void to_json(json& j, const ResourceReadResult& result) {
    j = {{"contents", result.contents}};
}

void to_json(json& j, const PromptMessage& message) {
    j = {
        {"role", message.role},
        {"content", message.content}
    };
}

void to_json(json& j, const GetPromptResult& result) {
    j = json::object();
    if (result.description) {
        j["description"] = *result.description;
    }
    j["messages"] = result.messages;
}

} // namespace stdio_mcp
