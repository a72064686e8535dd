#pragma once

#include "mcp/Handlers.hpp"

namespace stdio_mcp {

/**
 * @brief MCP tool computing Body Mass Index from weight and height
 *
 * A non-positive height is reported as a tool-level error (isError) rather
 * than a protocol error.
 */
class CalculatorTool : public IToolHandler {
public:
    static ToolInfo get_info();

    /**
     * @param args JSON object with numeric "weightKg" and "heightM"
     * @return "BMI: <value>" rounded to two decimals
     */
    CallToolResult call(const json& args) override;
};

} // namespace stdio_mcp
