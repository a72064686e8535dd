#include "WeatherTool.hpp"
#include "mcp/McpError.hpp"
#include <spdlog/spdlog.h>

namespace stdio_mcp {

ToolInfo WeatherTool::get_info() {
    return {
        "fetch-weather",
        "Fetches weather information for a given city",
        {
            {"type", "object"},
            {"properties", {
                {"city", {
                    {"type", "string"},
                    {"description", "The city name"}
                }}
            }},
            {"required", json::array({"city"})}
        },
        json{
            {"title", "Fetch Weather"},
            {"readOnlyHint", true},
            {"openWorldHint", true}
        }
    };
}

CallToolResult WeatherTool::call(const json& args) {
    if (!args.is_object() || !args.contains("city") || !args["city"].is_string()) {
        throw McpError(ErrorKind::InvalidParams, "Missing 'city' parameter");
    }

    std::string city = args["city"];
    spdlog::debug("WeatherTool: fetching weather for {}", city);

    json weather = {
        {"city", city},
        {"temperature", "72°F"},
        {"condition", "Partly Cloudy"},
        {"humidity", "65%"},
        {"windSpeed", "10 mph"}
    };

    return CallToolResult::success({TextContent("Weather for " + city + ":\n" + weather.dump(2))});
}

} // namespace stdio_mcp
