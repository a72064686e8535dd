#pragma once

#include "mcp/Handlers.hpp"
#include <filesystem>

namespace stdio_mcp {

/**
 * @brief Serves files below a base directory as file:///data/<relative path>
 *
 * Requests that resolve outside the base directory are rejected.
 */
class FileResource : public IResourceHandler {
public:
    static constexpr const char* URI_PREFIX = "file:///data/";

    /**
     * @brief Construct resource over a base directory
     * @param base_dir Directory holding the served files
     */
    explicit FileResource(std::filesystem::path base_dir);

    /**
     * @brief Routing entry; file resources are not listed individually
     */
    static ResourceInfo get_info();

    /**
     * @throws McpError with ErrorKind::Internal on a malformed URI, a path
     *         outside the base directory, a read failure, or content that
     *         is not valid UTF-8 text
     */
    ResourceReadResult read(const std::string& uri) override;

    /**
     * @brief MIME type derived from the file extension
     */
    static std::string mime_type_for(const std::filesystem::path& path);

private:
    std::filesystem::path base_dir_;
};

} // namespace stdio_mcp
