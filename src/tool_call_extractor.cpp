#include "tool_call_extractor.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>

namespace voxlink {

namespace {

bool is_trailing_punct(char c) {
    return c == '"' || c == '\'' || c == ',' || c == '.';
}

std::string clean_argument(ToolAction action, std::string value) {
    utils::trim(value);
    if (action == ToolAction::OpenUrl) {
        // Only the first whitespace-delimited token is the URL
        size_t ws = value.find_first_of(" \t\r\n");
        if (ws != std::string::npos) value.erase(ws);
        while (!value.empty() && is_trailing_punct(value.back())) value.pop_back();
        while (!value.empty() && (value.front() == '"' || value.front() == '\'')) value.erase(0, 1);
    } else {
        while (!value.empty() && is_trailing_punct(value.back())) value.pop_back();
        utils::trim(value);
    }
    return value;
}

} // namespace

ToolCallExtractor::ToolCallExtractor() {
    command_patterns_.push_back({std::regex(R"(CMD_OPEN_URL:\s*(\S+))"), ToolAction::OpenUrl});
    command_patterns_.push_back({std::regex(R"(CMD_RUN_APP:\s*([^.\n]+)\.?)"), ToolAction::RunApp});
    command_patterns_.push_back({std::regex(R"(open_url\(([^)]*)\))"), ToolAction::OpenUrl});

    decoration_patterns_.push_back(std::regex("\\[\xF0\x9F\x9B\xA0[^\\]]*\\]"));  // [🛠️ ...]
    decoration_patterns_.push_back(std::regex(R"(<function[\s\S]*?</function>)"));
}

std::optional<ToolInvocation> ToolCallExtractor::from_structured(const ToolCall& call) const {
    auto action = parse_tool_action(call.name);
    if (!action) {
        LOG_TOOL("Ignoring unsupported tool call: " + call.name);
        return std::nullopt;
    }
    ToolInvocation inv;
    inv.action = *action;
    inv.arguments = call.arguments;
    return inv;
}

Extraction ToolCallExtractor::extract(const std::string& text) const {
    struct Found {
        size_t pos;
        ToolInvocation inv;
    };
    std::vector<Found> found;

    for (const auto& pattern : command_patterns_) {
        auto begin = std::sregex_iterator(text.begin(), text.end(), pattern.re);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            std::string arg = clean_argument(pattern.action, (*it)[1].str());
            if (arg.empty()) continue;
            ToolInvocation inv;
            inv.action = pattern.action;
            inv.arguments[tool_argument_key(pattern.action)] = arg;
            found.push_back({static_cast<size_t>(it->position(0)), std::move(inv)});
        }
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const Found& a, const Found& b) { return a.pos < b.pos; });

    Extraction result;
    for (auto& f : found) {
        LOG_TOOL("Text command: " + f.inv.name() + "(" + f.inv.argument() + ")");
        result.invocations.push_back(std::move(f.inv));
    }
    result.text = strip(text);
    return result;
}

std::string ToolCallExtractor::strip(const std::string& text) const {
    std::string out = text;
    for (const auto& pattern : command_patterns_) {
        out = std::regex_replace(out, pattern.re, "");
    }
    for (const auto& re : decoration_patterns_) {
        out = std::regex_replace(out, re, "");
    }
    return utils::collapse_whitespace(out);
}

std::string tool_marker(const ToolInvocation& invocation, const ToolResult& result) {
    std::string marker = "[\xF0\x9F\x9B\xA0\xEF\xB8\x8F " + invocation.name() + "]";
    if (!result.success) {
        marker += " " + result.status;
    }
    return marker;
}

} // namespace voxlink
