#include "CalculatorTool.hpp"
#include "mcp/McpError.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace stdio_mcp {

namespace {

double require_number(const json& args, const char* key) {
    if (!args.is_object()) {
        throw McpError(ErrorKind::InvalidParams, "Arguments must be an object");
    }
    auto it = args.find(key);
    if (it == args.end() || !it->is_number()) {
        throw McpError(ErrorKind::InvalidParams, fmt::format("Missing or invalid '{}'", key));
    }
    return it->get<double>();
}

} // namespace

ToolInfo CalculatorTool::get_info() {
    return {
        "calculate-bmi",
        "Calculates Body Mass Index from weight and height",
        {
            {"type", "object"},
            {"properties", {
                {"weightKg", {
                    {"type", "number"},
                    {"description", "Weight in kilograms"}
                }},
                {"heightM", {
                    {"type", "number"},
                    {"description", "Height in meters"},
                    {"minimum", 0.1}
                }}
            }},
            {"required", json::array({"weightKg", "heightM"})}
        },
        json{
            {"title", "BMI Calculator"},
            {"readOnlyHint", true}
        }
    };
}

CallToolResult CalculatorTool::call(const json& args) {
    double weight_kg = require_number(args, "weightKg");
    double height_m = require_number(args, "heightM");

    if (height_m <= 0.0) {
        return CallToolResult::error("Height must be positive");
    }

    spdlog::debug("CalculatorTool: weight={}kg, height={}m", weight_kg, height_m);

    double bmi = weight_kg / (height_m * height_m);
    return CallToolResult::success({TextContent(fmt::format("BMI: {:.2f}", bmi))});
}

} // namespace stdio_mcp
