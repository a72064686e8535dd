#include "Dispatcher.hpp"
#include "McpError.hpp"
#include <spdlog/spdlog.h>

namespace stdio_mcp {

Dispatcher::Dispatcher(HandlerRegistry& registry, ServerConfig config)
    : registry_(registry), config_(std::move(config)) {}

std::optional<json> Dispatcher::handle_message(const json& message) {
    Envelope envelope;
    try {
        envelope = parse_envelope(message);
    } catch (const McpError& e) {
        std::optional<json> id = recover_id(message);
        if (!id) {
            spdlog::warn("Dropping invalid message without id: {}", e.what());
            return std::nullopt;
        }
        spdlog::warn("Rejecting invalid request id={}: {}", id->dump(), e.what());
        return json(Response::failure(*id, make_error_object(e)));
    }

    spdlog::debug("Handling {}: method={}, id={}",
        envelope.is_notification() ? "notification" : "request",
        envelope.method, envelope.id.dump());

    try {
        json result = dispatch(envelope);
        if (envelope.is_notification()) {
            return std::nullopt;
        }
        return json(Response::success(envelope.id, std::move(result)));
    } catch (const McpError& e) {
        spdlog::error("Error handling method {} ({}): {}", envelope.method, to_string(e.kind()), e.what());
        if (envelope.is_notification()) {
            return std::nullopt;
        }
        return json(Response::failure(envelope.id, make_error_object(e)));
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", envelope.method, e.what());
        if (envelope.is_notification()) {
            return std::nullopt;
        }
        return json(Response::failure(envelope.id, make_error_object(e)));
    }
}

json Dispatcher::dispatch(const Envelope& envelope) {
    const std::string& method = envelope.method;

    if (method == "initialize") {
        return handle_initialize(envelope.params);
    } else if (method == "initialized" || method == "notifications/initialized") {
        return handle_initialized();
    } else if (method == "ping") {
        return handle_ping();
    } else if (method == "tools/list") {
        return handle_tools_list();
    } else if (method == "tools/call") {
        return handle_tools_call(envelope.params);
    } else if (method == "resources/list") {
        return handle_resources_list();
    } else if (method == "resources/read") {
        return handle_resources_read(envelope.params);
    } else if (method == "prompts/list") {
        return handle_prompts_list();
    } else if (method == "prompts/get") {
        return handle_prompts_get(envelope.params);
    }

    throw McpError(ErrorKind::MethodNotFound, "Method not found: " + method);
}

json Dispatcher::handle_initialize(const std::optional<json>& params) {
    spdlog::info("Handling initialize request");

    // Extract client info if provided
    if (params && params->is_object() && params->contains("clientInfo")) {
        const json& client_info = (*params)["clientInfo"];
        if (client_info.is_object()) {
            auto field = [&client_info](const char* key) {
                auto it = client_info.find(key);
                return it != client_info.end() && it->is_string() ? it->get<std::string>() : std::string("unknown");
            };
            spdlog::info("Client: {} version {}", field("name"), field("version"));
        }
    }

    initialized_ = true;

    return {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {
            {"tools", json::object()},
            {"resources", json::object()},
            {"prompts", json::object()}
        }},
        {"serverInfo", {
            {"name", config_.name},
            {"version", config_.version}
        }}
    };
}

json Dispatcher::handle_initialized() {
    spdlog::info("Client sent initialized notification, server is ready");
    return json::object();
}

json Dispatcher::handle_ping() {
    spdlog::debug("Handling ping");
    return json::object();
}

json Dispatcher::handle_tools_list() {
    json tools = registry_.list_tools();
    spdlog::debug("Returning {} tools", tools.size());
    return {{"tools", tools}};
}

json Dispatcher::handle_tools_call(const std::optional<json>& params) {
    std::string tool_name = require_string(params, "name", "tool name");

    json arguments = params->value("arguments", json::object());
    if (arguments.is_null()) {
        arguments = json::object();
    }

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());

    auto handler = registry_.find_tool(tool_name);
    if (!handler) {
        throw McpError(ErrorKind::HandlerNotFound, "Tool not found: " + tool_name);
    }

    return handler->call(arguments);
}

json Dispatcher::handle_resources_list() {
    json resources = registry_.list_resources();
    spdlog::debug("Returning {} resources", resources.size());
    return {{"resources", resources}};
}

json Dispatcher::handle_resources_read(const std::optional<json>& params) {
    std::string uri = require_string(params, "uri", "resource URI");

    spdlog::debug("Reading resource: {}", uri);

    auto handler = registry_.find_resource(uri);
    if (!handler) {
        throw McpError(ErrorKind::HandlerNotFound, "Resource not found: " + uri);
    }

    return handler->read(uri);
}

json Dispatcher::handle_prompts_list() {
    json prompts = registry_.list_prompts();
    spdlog::debug("Returning {} prompts", prompts.size());
    return {{"prompts", prompts}};
}

json Dispatcher::handle_prompts_get(const std::optional<json>& params) {
    std::string prompt_name = require_string(params, "name", "prompt name");

    std::optional<json> arguments;
    auto it = params->find("arguments");
    if (it != params->end() && !it->is_null()) {
        arguments = *it;
    }

    spdlog::debug("Getting prompt: {}", prompt_name);

    auto handler = registry_.find_prompt(prompt_name);
    if (!handler) {
        throw McpError(ErrorKind::HandlerNotFound, "Prompt not found: " + prompt_name);
    }

    return handler->get(arguments);
}

std::string Dispatcher::require_string(const std::optional<json>& params,
                                       const char* key, const char* what) {
    if (!params || params->is_null()) {
        throw McpError(ErrorKind::InvalidParams, "Missing params");
    }
    if (!params->is_object()) {
        throw McpError(ErrorKind::InvalidParams, "params must be an object");
    }

    auto it = params->find(key);
    if (it == params->end() || !it->is_string()) {
        throw McpError(ErrorKind::InvalidParams, std::string("Missing ") + what);
    }
    return it->get<std::string>();
}

} // namespace stdio_mcp
