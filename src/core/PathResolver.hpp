#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace stdio_mcp {

/**
 * @brief Resolves client-supplied relative paths against a base directory
 *
 * Used by resources that expose files: a request may only reach files
 * inside the base directory, symlinks and ".." included.
 */
class PathResolver {
public:
    /**
     * @brief Resolve a relative path inside a base directory
     *
     * @param base_dir Directory the result must stay inside
     * @param relative Path requested by the client
     * @return Canonical path, or nullopt if it escapes base_dir
     */
    static std::optional<std::filesystem::path> resolve_within(
        const std::filesystem::path& base_dir,
        const std::string& relative
    );

    /**
     * @brief Check whether candidate lies inside base (both already normalized)
     */
    static bool is_within(const std::filesystem::path& base, const std::filesystem::path& candidate);

private:
    /**
     * @brief Canonicalize when possible, otherwise normalize lexically
     */
    static std::filesystem::path normalize(const std::filesystem::path& path);
};

} // namespace stdio_mcp
