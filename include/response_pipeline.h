#pragma once

#include "common.h"
#include "cancellation.h"
#include "generation_backend.h"
#include "outbound_channel.h"
#include "sentence_segmenter.h"
#include "tool_call_extractor.h"
#include "tts_engine.h"
#include <functional>
#include <string>

namespace voxlink {

/**
 * @brief Collaborators a pipeline drives. Shared by all sessions.
 */
struct PipelineServices {
    GenerationBackend* backend = nullptr;
    SpeechSynthesizer* synthesizer = nullptr;   ///< null for text-only turns
    ToolExecutor* tools = nullptr;
    const ToolCallExtractor* extractor = nullptr;
    /// Called once per turn with the user text (background fact extraction); may be empty
    std::function<void(const std::string&)> schedule_fact_extraction;
};

struct PipelineOptions {
    size_t min_sentence_chars = 3;
    std::string apology_text;
    bool tools_enabled = true;
    size_t frame_bytes = DEFAULT_FRAME_BYTES;  ///< Largest outbound PCM message
    uint64_t session_id = 0;   ///< For trace logs only
};

enum class PipelineOutcome {
    Completed,   ///< Response streamed and end-of-turn sent
    Apologized,  ///< Backend failed; apology and end-of-turn sent
    Cancelled    ///< Superseded or disconnected; output stopped
};

const char* pipeline_outcome_name(PipelineOutcome outcome);

/**
 * @brief One utterance's response: generation, segmentation, synthesis, emission.
 *
 * Emits, in order: user_transcription, then per sentence its tool markers,
 * assistant_text and PCM frames, then end-of-turn. Every observable step
 * first checks the cancel token and that its generation is still current.
 *
 * Backend failures: a tool-call-shaped failure of the first (tools on)
 * attempt is retried once with tools, then once without; any other failure,
 * or a failure after output already reached the client, ends in the
 * apology sentence and end-of-turn.
 */
class ResponsePipeline {
public:
    ResponsePipeline(const PipelineServices& services,
                     const PipelineOptions& options,
                     OutboundChannel& out,
                     Generation generation,
                     CancelTokenPtr cancel);

    PipelineOutcome run(const std::string& user_text, const FactList& facts);

    Generation generation() const { return generation_; }

    /// Number of backend attempts made by run()
    int attempts() const { return attempts_; }

private:
    enum class AttemptResult { Finished, Stopped };

    AttemptResult attempt(const std::string& user_text, const FactList& facts, bool use_tools);
    bool speak_sentence(const std::string& sentence);
    bool run_tool(const ToolInvocation& invocation);
    bool emit_text(const std::string& text);
    bool synthesize(const std::string& text);
    PipelineOutcome apologize();
    bool alive() const;

    PipelineServices services_;
    PipelineOptions options_;
    OutboundChannel& out_;
    Generation generation_;
    CancelTokenPtr cancel_;
    int attempts_ = 0;
    size_t emitted_in_attempt_ = 0;
};

} // namespace voxlink
