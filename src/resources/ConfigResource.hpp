#pragma once

#include "mcp/Handlers.hpp"

namespace stdio_mcp {

/**
 * @brief Read-only application configuration served at config://app
 */
class ConfigResource : public IResourceHandler {
public:
    static ResourceInfo get_info();

    /**
     * @param uri Any config:// URI
     * @return Single JSON document describing the application
     */
    ResourceReadResult read(const std::string& uri) override;
};

} // namespace stdio_mcp
