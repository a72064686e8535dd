#include "JsonRpc.hpp"
#include "McpError.hpp"

namespace stdio_mcp {

namespace {

bool is_valid_id(const json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

} // namespace

Response Response::success(const json& id, json result) {
    Response response;
    response.id = id;
    response.result = std::move(result);
    return response;
}

Response Response::failure(const json& id, ErrorObject error) {
    Response response;
    response.id = id;
    response.error = std::move(error);
    return response;
}

Envelope parse_envelope(const json& message) {
    if (!message.is_object()) {
        throw McpError(ErrorKind::InvalidRequest, "Invalid Request: message must be a JSON object");
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() || *version != JSONRPC_VERSION) {
        throw McpError(ErrorKind::InvalidRequest, "Invalid Request: missing or invalid jsonrpc field");
    }

    auto method = message.find("method");
    if (method == message.end()) {
        throw McpError(ErrorKind::InvalidRequest, "Invalid Request: missing method field");
    }
    if (!method->is_string()) {
        throw McpError(ErrorKind::InvalidRequest, "Invalid Request: method must be a string");
    }

    Envelope envelope;
    envelope.method = method->get<std::string>();

    auto id = message.find("id");
    if (id != message.end()) {
        if (!is_valid_id(*id)) {
            throw McpError(ErrorKind::InvalidRequest, "Invalid Request: id must be a string, number or null");
        }
        envelope.has_id = true;
        envelope.id = *id;
    }

    auto params = message.find("params");
    if (params != message.end()) {
        envelope.params = *params;
    }

    return envelope;
}

std::optional<json> recover_id(const json& message) {
    if (!message.is_object()) {
        return std::nullopt;
    }
    auto id = message.find("id");
    if (id == message.end()) {
        return std::nullopt;
    }
    // A structured id cannot be echoed; answer with a null id instead
    return is_valid_id(*id) ? *id : json();
}

void to_json(json& j, const ErrorObject& error) {
    j = {
        {"code", error.code},
        {"message", error.message}
    };
    if (error.data) {
        j["data"] = *error.data;
    }
}

void from_json(const json& j, ErrorObject& error) {
    error.code = j.at("code").get<int>();
    error.message = j.at("message").get<std::string>();
    if (j.contains("data")) {
        error.data = j.at("data");
    } else {
        error.data.reset();
    }
}

void to_json(json& j, const Response& response) {
    j = {
        {"jsonrpc", JSONRPC_VERSION},
        {"id", response.id}
    };
    if (response.error) {
        j["error"] = *response.error;
    } else {
        j["result"] = response.result.value_or(json::object());
    }
}

void from_json(const json& j, Response& response) {
    if (!j.is_object()) {
        throw McpError(ErrorKind::InvalidRequest, "Response must be a JSON object");
    }
    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() || *version != JSONRPC_VERSION) {
        throw McpError(ErrorKind::InvalidRequest, "Response has missing or invalid jsonrpc field");
    }

    response.id = j.value("id", json());
    response.result.reset();
    response.error.reset();

    if (j.contains("error")) {
        response.error = j.at("error").get<ErrorObject>();
    } else if (j.contains("result")) {
        response.result = j.at("result");
    } else {
        throw McpError(ErrorKind::InvalidRequest, "Response has neither result nor error");
    }
}

} // namespace stdio_mcp
