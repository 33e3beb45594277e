#pragma once

#include <string>
#include <map>
#include <optional>

namespace voxlink {

/**
 * @brief Local actions the assistant may trigger
 */
enum class ToolAction {
    OpenUrl,   ///< open_url(url)
    OpenPath,  ///< open_path(path)
    RunApp     ///< run_app(app_name)
};

/// Wire name of an action ("open_url", "open_path", "run_app")
const char* tool_action_name(ToolAction action);

/// Argument key the action reads ("url", "path", "app_name")
const char* tool_argument_key(ToolAction action);

std::optional<ToolAction> parse_tool_action(const std::string& name);

/**
 * @brief A tool call as the backend reported it (name not yet validated)
 */
struct ToolCall {
    std::string name;
    std::map<std::string, std::string> arguments;
};

/**
 * @brief A validated request to perform a local action. Never persisted.
 */
struct ToolInvocation {
    ToolAction action = ToolAction::OpenUrl;
    std::map<std::string, std::string> arguments;

    std::string name() const { return tool_action_name(action); }

    /// Value of the action's main argument, empty if missing
    std::string argument() const {
        auto it = arguments.find(tool_argument_key(action));
        return it != arguments.end() ? it->second : std::string();
    }
};

/**
 * @brief Outcome of one tool execution
 */
struct ToolResult {
    bool success = false;
    std::string status;  ///< Human-readable, e.g. "Opened URL: https://..."

    static ToolResult success_result(const std::string& status) {
        ToolResult result;
        result.success = true;
        result.status = status;
        return result;
    }

    static ToolResult error_result(const std::string& status) {
        ToolResult result;
        result.success = false;
        result.status = status;
        return result;
    }
};

/**
 * @brief Performs tool invocations against the local OS.
 *
 * Implementations report failures in the returned ToolResult and never throw.
 */
class ToolExecutor {
public:
    virtual ~ToolExecutor() = default;

    virtual ToolResult open_url(const std::string& url) = 0;
    virtual ToolResult open_path(const std::string& path) = 0;
    virtual ToolResult run_app(const std::string& app_name) = 0;

    /**
     * @brief Dispatch an invocation to the matching action
     */
    ToolResult execute(const ToolInvocation& invocation);
};

} // namespace voxlink
