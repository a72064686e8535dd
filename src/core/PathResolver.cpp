#include "PathResolver.hpp"
#include <spdlog/spdlog.h>
#include <iterator>

namespace stdio_mcp {

std::filesystem::path PathResolver::normalize(const std::filesystem::path& path) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        spdlog::debug("Cannot canonicalize path {}: {}", path.string(), ec.message());
        return std::filesystem::absolute(path).lexically_normal();
    }
    return resolved;
}

bool PathResolver::is_within(const std::filesystem::path& base, const std::filesystem::path& candidate) {
    // Compare component by component so "/data2" is not inside "/data"
    auto base_it = base.begin();
    auto candidate_it = candidate.begin();
    for (; base_it != base.end(); ++base_it, ++candidate_it) {
        // A trailing separator shows up as an empty final component
        if (base_it->empty() && std::next(base_it) == base.end()) {
            break;
        }
        if (candidate_it == candidate.end() || *base_it != *candidate_it) {
            return false;
        }
    }
    return true;
}

std::optional<std::filesystem::path> PathResolver::resolve_within(
    const std::filesystem::path& base_dir,
    const std::string& relative
) {
    std::filesystem::path requested(relative);
    if (requested.is_absolute()) {
        spdlog::warn("Rejecting absolute path: {}", relative);
        return std::nullopt;
    }

    auto resolved_base = normalize(base_dir);
    auto resolved_requested = normalize(base_dir / requested);

    if (!is_within(resolved_base, resolved_requested)) {
        spdlog::warn("Path {} escapes base directory {}", resolved_requested.string(), resolved_base.string());
        return std::nullopt;
    }

    return resolved_requested;
}

} // namespace stdio_mcp
