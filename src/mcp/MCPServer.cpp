#include "MCPServer.hpp"
#include "McpError.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace stdio_mcp {

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, ServerConfig config)
    : transport_(std::move(transport)), dispatcher_(registry_, std::move(config)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized: {} v{}", dispatcher_.config().name, dispatcher_.config().version);
}

void MCPServer::register_tool(const ToolInfo& info, std::shared_ptr<IToolHandler> handler) {
    registry_.register_tool(info, std::move(handler));
}

void MCPServer::register_resource(const ResourceInfo& info, std::shared_ptr<IResourceHandler> handler) {
    registry_.register_resource(info, std::move(handler));
}

void MCPServer::register_prompt(const PromptInfo& info, std::shared_ptr<IPromptHandler> handler) {
    registry_.register_prompt(info, std::move(handler));
}

void MCPServer::run() {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    while (running_ && transport_->is_open()) {
        ReadResult incoming;
        try {
            incoming = transport_->read_message();
        } catch (const McpError& e) {
            if (e.kind() != ErrorKind::Parse) {
                running_ = false;
                transport_->close();
                spdlog::error("Transport failure, stopping server: {}", e.what());
                throw;
            }
            // No id can be recovered from an unparseable line
            spdlog::warn("Skipping malformed input line: {}", e.what());
            continue;
        }

        if (incoming.status == ReadStatus::Closed) {
            spdlog::info("Input stream closed, stopping server");
            break;
        }
        if (incoming.status == ReadStatus::Empty) {
            continue;
        }

        std::optional<json> response = dispatcher_.handle_message(incoming.message);

        if (response) {
            try {
                transport_->write_message(*response);
            } catch (const json::exception& e) {
                // Result could not be serialized; the request still gets its one response
                spdlog::error("Failed to serialize response: {}", e.what());
                transport_->write_message(json(Response::failure(response->at("id"), make_error_object(e))));
            }
        } else {
            spdlog::debug("Notification processed, no response sent");
        }
    }

    running_ = false;
    transport_->close();
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    spdlog::info("MCPServer stop requested");
    running_ = false;
}

} // namespace stdio_mcp
