#pragma once

#include "JsonRpc.hpp"
#include <stdexcept>
#include <string>

namespace stdio_mcp {

/**
 * @brief JSON-RPC 2.0 error codes used on the wire
 */
namespace error_codes {
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
}

/**
 * @brief Internal failure kinds raised by the transport, dispatcher and handlers
 */
enum class ErrorKind {
    InvalidRequest,   // Bad or missing envelope fields
    MethodNotFound,   // Unknown method name
    HandlerNotFound,  // Unknown tool, prompt or resource scheme
    InvalidParams,    // Missing or wrong-typed argument
    Parse,            // Input line is not valid JSON
    Transport,        // Stream I/O failure
    Internal          // Any other domain failure
};

/**
 * @brief Exception carrying an ErrorKind alongside its message
 */
class McpError : public std::runtime_error {
public:
    McpError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Map an internal failure kind to its JSON-RPC error code
 */
int to_error_code(ErrorKind kind) noexcept;

/**
 * @brief Human-readable name of an error kind, used in log output
 */
const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Build the "error" member of a response for an McpError
 *
 * The "data" member is only attached for internal failures (-32603)
 * and carries the original error text.
 */
ErrorObject make_error_object(const McpError& error);

/**
 * @brief Build the "error" member of a response for any other exception
 * @param error Exception thrown by a handler or by the dispatcher
 * @return Internal error object (-32603) with the original text in "data"
 */
ErrorObject make_error_object(const std::exception& error);

} // namespace stdio_mcp
