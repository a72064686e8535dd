#pragma once

#include "Dispatcher.hpp"
#include "HandlerRegistry.hpp"
#include "ITransport.hpp"
#include <atomic>
#include <memory>

namespace stdio_mcp {

/**
 * @brief MCP server driving the read -> dispatch -> write cycle
 *
 * Owns the transport and the handler registry. Each message is fully
 * handled and its response written before the next one is read.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @param config Server identity reported by initialize
     * @throws std::invalid_argument if transport is null
     */
    explicit MCPServer(std::unique_ptr<ITransport> transport, ServerConfig config = {});

    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Handler invoked by tools/call
     */
    void register_tool(const ToolInfo& info, std::shared_ptr<IToolHandler> handler);

    /**
     * @brief Register a resource handler for a URI scheme
     */
    void register_resource(const ResourceInfo& info, std::shared_ptr<IResourceHandler> handler);

    /**
     * @brief Register a prompt template
     */
    void register_prompt(const PromptInfo& info, std::shared_ptr<IPromptHandler> handler);

    HandlerRegistry& registry() { return registry_; }

    Dispatcher& dispatcher() { return dispatcher_; }

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or the transport reaches end of input.
     * Lines that are not valid JSON are logged and skipped.
     *
     * @throws McpError with ErrorKind::Transport on stream failure
     */
    void run();

    /**
     * @brief Signal server to stop gracefully after the current cycle
     */
    void stop();

private:
    std::unique_ptr<ITransport> transport_;
    HandlerRegistry registry_;
    Dispatcher dispatcher_;
    std::atomic<bool> running_{false};
};

} // namespace stdio_mcp
