#include "StdioTransport.hpp"
#include "McpError.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace stdio_mcp {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

ReadResult StdioTransport::read_message() {
    std::lock_guard<std::mutex> lock(read_mutex_);

    if (closed_) {
        return {ReadStatus::Closed, json()};
    }

    std::string line;
    if (!std::getline(in_, line)) {
        if (in_.eof()) {
            spdlog::debug("Reached end of input stream");
            return {ReadStatus::Closed, json()};
        }
        throw McpError(ErrorKind::Transport, "Error reading from input stream");
    }

    if (is_blank(line)) {
        spdlog::debug("Read empty line, treating as no message");
        return {ReadStatus::Empty, json()};
    }

    try {
        json message = json::parse(line);
        spdlog::debug("Read message: {}", line);
        return {ReadStatus::Message, std::move(message)};
    } catch (const json::parse_error& e) {
        throw McpError(ErrorKind::Parse, std::string("JSON parse error: ") + e.what());
    }
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump();

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) {
        throw McpError(ErrorKind::Transport, "Write on closed transport");
    }

    out_ << serialized << '\n';
    out_.flush();
    if (!out_) {
        throw McpError(ErrorKind::Transport, "Error writing to output stream");
    }
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return !closed_ && in_.good() && out_.good();
}

void StdioTransport::close() {
    if (!closed_.exchange(true)) {
        spdlog::debug("StdioTransport closed");
        std::lock_guard<std::mutex> lock(write_mutex_);
        out_.flush();
    }
}

} // namespace stdio_mcp
