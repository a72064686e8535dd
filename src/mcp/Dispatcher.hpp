#pragma once

#include "HandlerRegistry.hpp"
#include "JsonRpc.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <optional>
#include <string>

namespace stdio_mcp {

using json = nlohmann::json;

/**
 * @brief Identity reported in the initialize response
 */
struct ServerConfig {
    std::string name = "StdioMcpServer";
    std::string version = "1.0.0";
};

/**
 * @brief JSON-RPC 2.0 dispatcher for the MCP method surface
 *
 * Validates each envelope, routes it to a built-in procedure or to a
 * handler from the registry, and builds the response. Notifications never
 * get a response, whether they succeed or fail.
 *
 * Supported methods: initialize, initialized (and notifications/initialized),
 * ping, tools/list, tools/call, resources/list, resources/read,
 * prompts/list, prompts/get
 */
class Dispatcher {
public:
    /**
     * @brief Construct dispatcher over a registry owned by the caller
     * @param registry Handler registry, must outlive the dispatcher
     * @param config Server identity for initialize
     */
    Dispatcher(HandlerRegistry& registry, ServerConfig config);

    /**
     * @brief Handle one decoded message
     * @param message Raw JSON value from the transport
     * @return Response to write, or nullopt when nothing must be written
     */
    std::optional<json> handle_message(const json& message);

    /// @return true once initialize has been handled
    bool is_initialized() const { return initialized_; }

    const ServerConfig& config() const { return config_; }

private:
    /**
     * @brief Route a validated envelope to its procedure
     * @return Result value for the response
     * @throws McpError or any exception raised by a handler
     */
    json dispatch(const Envelope& envelope);

    json handle_initialize(const std::optional<json>& params);
    json handle_initialized();
    json handle_ping();
    json handle_tools_list();
    json handle_tools_call(const std::optional<json>& params);
    json handle_resources_list();
    json handle_resources_read(const std::optional<json>& params);
    json handle_prompts_list();
    json handle_prompts_get(const std::optional<json>& params);

    /**
     * @brief Require params to be an object carrying a string member
     * @return Value of the member
     * @throws McpError with ErrorKind::InvalidParams otherwise
     */
    static std::string require_string(const std::optional<json>& params,
                                      const char* key, const char* what);

    HandlerRegistry& registry_;
    ServerConfig config_;
    std::atomic<bool> initialized_{false};
};

} // namespace stdio_mcp
