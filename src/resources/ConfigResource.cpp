#include "ConfigResource.hpp"
#include <spdlog/spdlog.h>

namespace stdio_mcp {

ResourceInfo ConfigResource::get_info() {
    return {
        "config",
        "config://app",
        "Application Configuration",
        "Current application configuration",
        "application/json"
    };
}

ResourceReadResult ConfigResource::read(const std::string& uri) {
    spdlog::debug("ConfigResource: reading {}", uri);

    json config = {
        {"appName", "Stdio MCP Server"},
        {"version", "1.0.0"},
        {"environment", "development"},
        {"features", {
            {"tools", true},
            {"resources", true},
            {"prompts", true}
        }}
    };

    ResourceContents contents;
    contents.uri = uri;
    contents.mime_type = "application/json";
    contents.text = config.dump(2);

    return {{contents}};
}

} // namespace stdio_mcp
