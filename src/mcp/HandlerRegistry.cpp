#include "HandlerRegistry.hpp"
#include <spdlog/spdlog.h>
#include <mutex>
#include <stdexcept>

namespace stdio_mcp {

void HandlerRegistry::register_tool(const ToolInfo& info, std::shared_ptr<IToolHandler> handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto [it, inserted] = tools_.insert_or_assign(info.name, Binding<ToolInfo, IToolHandler>{info, std::move(handler)});
    spdlog::info("{} tool: {}", inserted ? "Registered" : "Replaced", it->first);
}

void HandlerRegistry::register_resource(const ResourceInfo& info, std::shared_ptr<IResourceHandler> handler) {
    if (info.scheme.empty()) {
        throw std::invalid_argument("Resource scheme cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Resource handler cannot be null");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto [it, inserted] = resources_.insert_or_assign(
        info.scheme, Binding<ResourceInfo, IResourceHandler>{info, std::move(handler)});
    spdlog::info("{} resource scheme: {}://", inserted ? "Registered" : "Replaced", it->first);
}

void HandlerRegistry::register_prompt(const PromptInfo& info, std::shared_ptr<IPromptHandler> handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Prompt name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Prompt handler cannot be null");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto [it, inserted] = prompts_.insert_or_assign(info.name, Binding<PromptInfo, IPromptHandler>{info, std::move(handler)});
    spdlog::info("{} prompt: {}", inserted ? "Registered" : "Replaced", it->first);
}

std::shared_ptr<IToolHandler> HandlerRegistry::find_tool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    return it != tools_.end() ? it->second.handler : nullptr;
}

std::shared_ptr<IResourceHandler> HandlerRegistry::find_resource(const std::string& uri) const {
    std::string scheme = scheme_of(uri);
    if (scheme.empty()) {
        return nullptr;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = resources_.find(scheme);
    return it != resources_.end() ? it->second.handler : nullptr;
}

std::shared_ptr<IPromptHandler> HandlerRegistry::find_prompt(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = prompts_.find(name);
    return it != prompts_.end() ? it->second.handler : nullptr;
}

std::vector<ToolInfo> HandlerRegistry::list_tools() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ToolInfo> result;
    result.reserve(tools_.size());
    for (const auto& [name, binding] : tools_) {
        result.push_back(binding.info);
    }
    return result;
}

std::vector<ResourceInfo> HandlerRegistry::list_resources() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ResourceInfo> result;
    for (const auto& [scheme, binding] : resources_) {
        // Routable but not advertised
        if (binding.info.uri.empty()) {
            continue;
        }
        result.push_back(binding.info);
    }
    return result;
}

std::vector<PromptInfo> HandlerRegistry::list_prompts() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PromptInfo> result;
    result.reserve(prompts_.size());
    for (const auto& [name, binding] : prompts_) {
        result.push_back(binding.info);
    }
    return result;
}

size_t HandlerRegistry::size(HandlerGroup group) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    switch (group) {
        case HandlerGroup::Tools: return tools_.size();
        case HandlerGroup::Resources: return resources_.size();
        case HandlerGroup::Prompts: return prompts_.size();
    }
    return 0;
}

std::string HandlerRegistry::scheme_of(const std::string& uri) {
    auto pos = uri.find("://");
    if (pos == std::string::npos || pos == 0) {
        return {};
    }
    return uri.substr(0, pos);
}

} // namespace stdio_mcp
