#pragma once

#include "mcp/Handlers.hpp"

namespace stdio_mcp {

/**
 * @brief MCP tool returning weather information for a city
 *
 * Serves fixed sample data; no external service is contacted.
 */
class WeatherTool : public IToolHandler {
public:
    static ToolInfo get_info();
    CallToolResult call(const json& args) override;
};

} // namespace stdio_mcp
