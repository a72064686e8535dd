#include "FileResource.hpp"
#include "core/PathResolver.hpp"
#include "mcp/McpError.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace stdio_mcp {

namespace {

// Well-formed UTF-8: no overlongs, no surrogates, nothing above U+10FFFF
bool is_valid_utf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t extra = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;

        if (c < 0x80) {
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            extra = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            extra = 2;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            extra = 3;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }

        if (n - i <= extra) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if (cc < lo || cc > hi) {
                return false;
            }
            lo = 0x80;
            hi = 0xBF;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace

FileResource::FileResource(std::filesystem::path base_dir)
    : base_dir_(std::move(base_dir)) {
    spdlog::debug("FileResource serving {}", base_dir_.string());
}

ResourceInfo FileResource::get_info() {
    return {
        "file",
        "",
        "Data Files",
        "Files under the server data directory",
        "application/octet-stream"
    };
}

std::string FileResource::mime_type_for(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (ext == ".txt") {
        return "text/plain";
    }
    if (ext == ".json") {
        return "application/json";
    }
    return "application/octet-stream";
}

ResourceReadResult FileResource::read(const std::string& uri) {
    const std::string prefix = URI_PREFIX;
    if (uri.compare(0, prefix.size(), prefix) != 0 || uri.size() == prefix.size()) {
        throw McpError(ErrorKind::Internal, "Invalid URI: " + uri);
    }

    std::string filename = uri.substr(prefix.size());
    spdlog::debug("FileResource: reading {}", filename);

    auto path = PathResolver::resolve_within(base_dir_, filename);
    if (!path) {
        throw McpError(ErrorKind::Internal, "Access denied: Path traversal attempt");
    }

    std::ifstream file(*path, std::ios::binary);
    if (!file || !std::filesystem::is_regular_file(*path)) {
        spdlog::error("FileResource: cannot open {}", path->string());
        throw McpError(ErrorKind::Internal, "Failed to read file: " + filename);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw McpError(ErrorKind::Internal, "Failed to read file: " + filename);
    }

    std::string text = buffer.str();
    if (!is_valid_utf8(text)) {
        spdlog::warn("FileResource: {} is not UTF-8 text", path->string());
        throw McpError(ErrorKind::Internal, "Failed to read file: " + filename + ": not valid UTF-8 text");
    }

    ResourceContents contents;
    contents.uri = uri;
    contents.mime_type = mime_type_for(*path);
    contents.text = std::move(text);
    contents.size = contents.text->size();

    return {{contents}};
}

} // namespace stdio_mcp
