#include "McpError.hpp"

namespace stdio_mcp {

McpError::McpError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

int to_error_code(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidRequest:
            return error_codes::INVALID_REQUEST;
        case ErrorKind::MethodNotFound:
        case ErrorKind::HandlerNotFound:
            return error_codes::METHOD_NOT_FOUND;
        case ErrorKind::InvalidParams:
            return error_codes::INVALID_PARAMS;
        case ErrorKind::Parse:
        case ErrorKind::Transport:
        case ErrorKind::Internal:
            break;
    }
    return error_codes::INTERNAL_ERROR;
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidRequest: return "invalid request";
        case ErrorKind::MethodNotFound: return "method not found";
        case ErrorKind::HandlerNotFound: return "handler not found";
        case ErrorKind::InvalidParams: return "invalid params";
        case ErrorKind::Parse: return "parse error";
        case ErrorKind::Transport: return "transport error";
        case ErrorKind::Internal: return "internal error";
    }
    return "unknown error";
}

ErrorObject make_error_object(const McpError& error) {
    ErrorObject error_object;
    error_object.code = to_error_code(error.kind());
    error_object.message = error.what();

    if (error_object.code == error_codes::INTERNAL_ERROR) {
        error_object.data = json(error.what());
    }
    return error_object;
}

ErrorObject make_error_object(const std::exception& error) {
    ErrorObject error_object;
    error_object.code = error_codes::INTERNAL_ERROR;
    error_object.message = std::string("Internal error: ") + error.what();
    error_object.data = json(error.what());
    return error_object;
}

} // namespace stdio_mcp
