#pragma once

#include "common.h"
#include "cancellation.h"
#include "tool.h"
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace voxlink {

/// A piece of assistant text as it streams in
struct TextFragment {
    std::string text;
};

/// One item of a generation stream
using StreamItem = std::variant<TextFragment, ToolCall>;

/**
 * @brief Receives stream items in order.
 * @return false to stop the stream early (not an error)
 */
using StreamItemCallback = std::function<bool(const StreamItem&)>;

/**
 * @brief Text-generating backend (LLM) consumed by the response pipeline.
 *
 * generate() delivers items through the callback as they arrive and returns
 * when the stream is exhausted, stopped by the callback, or cancelled.
 * Failures are thrown as BackendError; tool_call_shaped() marks failures
 * caused by tool invocation so the caller can retry.
 */
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;

    virtual void generate(const std::string& user_text,
                          const FactList& facts,
                          bool use_tools,
                          const CancelToken& cancel,
                          const StreamItemCallback& on_item) = 0;

    /**
     * @brief Ask the model for one new fact about the user in user_text
     * @return The fact, or nullopt if there is none (or the call failed)
     */
    virtual std::optional<std::string> extract_fact(const std::string& user_text,
                                                    const FactList& facts) = 0;
};

} // namespace voxlink
