#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace stdio_mcp {

using json = nlohmann::json;

/// JSON-RPC version tag every envelope must carry
inline constexpr const char* JSONRPC_VERSION = "2.0";

/// MCP protocol revision announced by initialize
inline constexpr const char* PROTOCOL_VERSION = "2024-11-05";

/**
 * @brief Decoded JSON-RPC request or notification
 */
struct Envelope {
    bool has_id = false;          // false for notifications
    json id;                      // string, number or null when has_id
    std::string method;
    std::optional<json> params;

    bool is_notification() const { return !has_id; }
};

/**
 * @brief The "error" member of a failed response
 */
struct ErrorObject {
    int code = 0;
    std::string message;
    std::optional<json> data;
};

/**
 * @brief Outgoing JSON-RPC response; exactly one of result/error is set
 */
struct Response {
    json id;
    std::optional<json> result;
    std::optional<ErrorObject> error;

    static Response success(const json& id, json result);
    static Response failure(const json& id, ErrorObject error);
};

/**
 * @brief Validate and decode an incoming message
 *
 * @param message Raw JSON value read from the transport
 * @return Decoded envelope
 * @throws McpError with ErrorKind::InvalidRequest when the jsonrpc tag is not
 *         "2.0", the method is missing or not a string, the id is an object,
 *         array or boolean, or the message is not an object
 */
Envelope parse_envelope(const json& message);

/**
 * @brief Recover the id of a message that failed validation
 * @return The id when the message is an object that has one; null when
 *         that id is not a string or number
 */
std::optional<json> recover_id(const json& message);

void to_json(json& j, const ErrorObject& error);
void from_json(const json& j, ErrorObject& error);
void to_json(json& j, const Response& response);
void from_json(const json& j, Response& response);

} // namespace stdio_mcp
