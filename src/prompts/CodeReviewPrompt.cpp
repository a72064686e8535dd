#include "CodeReviewPrompt.hpp"
#include "mcp/McpError.hpp"
#include <spdlog/spdlog.h>

namespace stdio_mcp {

PromptInfo CodeReviewPrompt::get_info() {
    return {
        "review-code",
        "Generates a prompt to ask the LLM to review code",
        std::vector<PromptArgument>{
            {"code", "The code snippet to review", true},
            {"focus", "Optional area of focus for the review (performance, security, style, general)", false}
        }
    };
}

GetPromptResult CodeReviewPrompt::get(const std::optional<json>& arguments) {
    if (!arguments || !arguments->is_object()) {
        throw McpError(ErrorKind::InvalidParams, "Missing arguments");
    }

    auto code = arguments->find("code");
    if (code == arguments->end() || !code->is_string()) {
        throw McpError(ErrorKind::InvalidParams, "Missing 'code' argument");
    }

    std::string focus = "general";
    auto focus_it = arguments->find("focus");
    if (focus_it != arguments->end() && focus_it->is_string()) {
        focus = focus_it->get<std::string>();
    }

    spdlog::debug("CodeReviewPrompt: focus={}", focus);

    std::string text = "Please review the following code for potential issues and suggest improvements";
    if (focus != "general") {
        text += ", focusing specifically on " + focus;
    }
    text += ":\n\n```\n" + code->get<std::string>() + "\n```";

    GetPromptResult result;
    result.description = "Requesting " + focus + " review for code snippet";
    result.messages.push_back({"user", {TextContent(text)}});
    return result;
}

} // namespace stdio_mcp
