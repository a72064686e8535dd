#pragma once

#include "mcp/Handlers.hpp"

namespace stdio_mcp {

/**
 * @brief Prompt template asking the model to review a code snippet
 *
 * Arguments: "code" (required), "focus" (optional: performance, security,
 * style, general; defaults to general).
 */
class CodeReviewPrompt : public IPromptHandler {
public:
    static PromptInfo get_info();
    GetPromptResult get(const std::optional<json>& arguments) override;
};

} // namespace stdio_mcp
