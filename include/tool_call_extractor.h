#pragma once

#include "tool.h"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace voxlink {

/**
 * @brief Invocations found in a piece of text plus what is left to speak
 */
struct Extraction {
    std::vector<ToolInvocation> invocations;  ///< In order of appearance
    std::string text;                         ///< Markers removed, whitespace collapsed
};

/**
 * @brief Turns model output into tool invocations and speakable text.
 *
 * Structured calls are validated and passed through. Free text is scanned for
 * the inline command forms
 *   CMD_OPEN_URL: <token>
 *   CMD_RUN_APP: <name up to the next period>
 *   open_url(<url>)
 * and every matched marker is removed from the spoken text with the same
 * patterns. Decorative "[🛠️ ...]" tags and <function>...</function> blocks
 * are removed without producing invocations.
 */
class ToolCallExtractor {
public:
    ToolCallExtractor();

    /**
     * @brief Validate a structured call
     * @return Invocation, or nullopt if the tool name is not supported
     */
    std::optional<ToolInvocation> from_structured(const ToolCall& call) const;

    Extraction extract(const std::string& text) const;

    /// Text with all markers and decorations removed
    std::string strip(const std::string& text) const;

private:
    struct Pattern {
        std::regex re;
        ToolAction action;
    };

    std::vector<Pattern> command_patterns_;
    std::vector<std::regex> decoration_patterns_;
};

/**
 * @brief The "[🛠️ name]" line shown to the user for an executed tool
 */
std::string tool_marker(const ToolInvocation& invocation, const ToolResult& result);

} // namespace voxlink
