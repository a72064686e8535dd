#pragma once

#include <nlohmann/json.hpp>

namespace stdio_mcp {

using json = nlohmann::json;

/**
 * @brief Outcome of a single transport read
 */
enum class ReadStatus {
    Message,  // A JSON value was decoded
    Empty,    // Whitespace-only line, caller should read again
    Closed    // End of input
};

struct ReadResult {
    ReadStatus status = ReadStatus::Closed;
    json message;
};

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations frame JSON-RPC messages over an underlying byte stream,
 * one JSON value per message in both directions.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message from transport
     * @return Decoded message, Empty for a blank line, Closed on end of input
     * @throws McpError with ErrorKind::Parse for a line that is not valid JSON
     * @throws McpError with ErrorKind::Transport on stream failure
     */
    virtual ReadResult read_message() = 0;

    /**
     * @brief Write JSON-RPC message to transport and flush it
     * @param message JSON message to write
     * @throws McpError with ErrorKind::Transport on stream failure
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Release the transport; calling it more than once is harmless
     */
    virtual void close() = 0;
};

} // namespace stdio_mcp
