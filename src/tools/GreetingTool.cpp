#include "GreetingTool.hpp"
#include "mcp/McpError.hpp"
#include <spdlog/spdlog.h>

namespace stdio_mcp {

ToolInfo GreetingTool::get_info() {
    return {
        "greet",
        "Greets a person with a friendly message",
        {
            {"type", "object"},
            {"properties", {
                {"name", {
                    {"type", "string"},
                    {"description", "The name of the person to greet"}
                }}
            }},
            {"required", json::array({"name"})}
        },
        json{
            {"title", "Greet Tool"},
            {"readOnlyHint", true}
        }
    };
}

CallToolResult GreetingTool::call(const json& args) {
    if (!args.is_object() || !args.contains("name") || !args["name"].is_string()) {
        throw McpError(ErrorKind::InvalidParams, "Missing 'name' parameter");
    }

    std::string name = args["name"];
    spdlog::debug("GreetingTool: greeting {}", name);

    return CallToolResult::success({TextContent("Hello, " + name + "! Welcome to MCP.")});
}

} // namespace stdio_mcp
