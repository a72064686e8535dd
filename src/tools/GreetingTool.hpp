#pragma once

#include "mcp/Handlers.hpp"

namespace stdio_mcp {

/**
 * @brief MCP tool that greets a person by name
 */
class GreetingTool : public IToolHandler {
public:
    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolInfo with name, description, and input schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "name" parameter
     * @return Greeting text
     */
    CallToolResult call(const json& args) override;
};

} // namespace stdio_mcp
