#pragma once

#include "common.h"
#include "config.h"
#include "generation_backend.h"
#include <string>
#include <memory>
#include <vector>
#include <map>

namespace voxlink {

enum class ChatDialect {
    Ollama,   ///< NDJSON lines: {"message":{"content":...,"tool_calls":[...]},"done":false}
    OpenAI    ///< SSE: "data: {"choices":[{"delta":{...}}]}" ... "data: [DONE]"
};

ChatDialect parse_chat_dialect(const std::string& provider);

/**
 * @brief Incremental parser for a streamed chat response body.
 *
 * Bytes may be split anywhere; complete lines are decoded and turned into
 * StreamItems. Error payloads inside the stream throw BackendError.
 */
class ChatStreamParser {
public:
    ChatStreamParser(ChatDialect dialect, StreamItemCallback on_item);

    /**
     * @brief Consume a piece of the response body
     * @return false once the consumer asked to stop or the stream reported its end
     */
    bool feed(const std::string& bytes);

    /**
     * @brief End of body: decode a trailing partial line and deliver accumulated tool calls
     */
    void finish();

    bool done() const { return done_; }

private:
    struct PendingToolCall {
        std::string name;
        std::string arguments;
    };

    bool handle_line(const std::string& line);
    bool handle_ollama(const std::string& line);
    bool handle_openai(const std::string& line);
    bool flush_tool_calls();
    bool deliver(const StreamItem& item);

    ChatDialect dialect_;
    StreamItemCallback on_item_;
    std::string line_buffer_;
    std::map<int, PendingToolCall> tool_calls_;
    bool stopped_ = false;
    bool done_ = false;
    bool tool_calls_flushed_ = false;
};

/**
 * @brief Streaming chat backend over HTTP (libcurl).
 *
 * Two wire dialects, chosen by LLMConfig::provider:
 * - "ollama": POST /api/chat, NDJSON stream, tool calls arrive whole
 * - "openai": POST /v1/chat/completions (Groq etc.), SSE stream, tool-call
 *   deltas accumulated by index and delivered when the stream ends
 *
 * Text fragments are delivered as they arrive. HTTP 400 and error bodies that
 * mention tool/function calls are reported as tool-call-shaped BackendErrors.
 */
class LLMClient : public GenerationBackend {
public:
    explicit LLMClient(const LLMConfig& config);
    ~LLMClient() override;

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    void generate(const std::string& user_text,
                  const FactList& facts,
                  bool use_tools,
                  const CancelToken& cancel,
                  const StreamItemCallback& on_item) override;

    std::optional<std::string> extract_fact(const std::string& user_text,
                                            const FactList& facts) override;

    /**
     * @brief System prompt with today's date and the known user facts appended
     */
    std::string build_system_prompt(const FactList& facts) const;

    /// JSON array of tool definitions (open_url, open_path, run_app)
    static std::string tool_definitions_json();

    /**
     * @brief Classify a backend failure as tool-call shaped
     * @param http_status HTTP status of the response (0 if none)
     * @param message Error text from the transport or response body
     */
    static bool is_tool_call_error(long http_status, const std::string& message);

    /**
     * @brief Parse the {"new_fact": ...} answer of a fact extraction call
     * @return The fact, or nullopt for null/empty/invalid answers
     */
    static std::optional<std::string> parse_fact_answer(const std::string& content);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
