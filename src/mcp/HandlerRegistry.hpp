#pragma once

#include "Handlers.hpp"
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace stdio_mcp {

/**
 * @brief Handler groups, each with its own name space
 */
enum class HandlerGroup {
    Tools,
    Resources,
    Prompts
};

/**
 * @brief Lock-guarded mapping from (group, name) to handler
 *
 * Registering a name that is already bound replaces the previous handler.
 * There is no removal. Lookups hand out shared ownership, so a replaced
 * handler stays alive until any call already running on it returns.
 *
 * Resources are keyed by URI scheme: "config://app" is served by the
 * handler registered with scheme "config".
 */
class HandlerRegistry {
public:
    /**
     * @brief Register or replace a tool
     * @throws std::invalid_argument on empty name or null handler
     */
    void register_tool(const ToolInfo& info, std::shared_ptr<IToolHandler> handler);

    /**
     * @brief Register or replace the handler for a URI scheme
     * @throws std::invalid_argument on empty scheme or null handler
     */
    void register_resource(const ResourceInfo& info, std::shared_ptr<IResourceHandler> handler);

    /**
     * @brief Register or replace a prompt
     * @throws std::invalid_argument on empty name or null handler
     */
    void register_prompt(const PromptInfo& info, std::shared_ptr<IPromptHandler> handler);

    /// @return Handler or nullptr when no tool has this name
    std::shared_ptr<IToolHandler> find_tool(const std::string& name) const;

    /// @return Handler registered for the scheme of uri, or nullptr
    std::shared_ptr<IResourceHandler> find_resource(const std::string& uri) const;

    /// @return Handler or nullptr when no prompt has this name
    std::shared_ptr<IPromptHandler> find_prompt(const std::string& name) const;

    std::vector<ToolInfo> list_tools() const;
    std::vector<ResourceInfo> list_resources() const;
    std::vector<PromptInfo> list_prompts() const;

    /// @return Number of bindings in a group
    size_t size(HandlerGroup group) const;

    /**
     * @brief Extract the scheme of a URI ("config://app" -> "config")
     * @return Scheme, or an empty string when uri has no "://" separator
     */
    static std::string scheme_of(const std::string& uri);

private:
    template <typename Info, typename Handler>
    struct Binding {
        Info info;
        std::shared_ptr<Handler> handler;
    };

    mutable std::shared_mutex mutex_;
    std::map<std::string, Binding<ToolInfo, IToolHandler>> tools_;
    std::map<std::string, Binding<ResourceInfo, IResourceHandler>> resources_;
    std::map<std::string, Binding<PromptInfo, IPromptHandler>> prompts_;
};

} // namespace stdio_mcp
