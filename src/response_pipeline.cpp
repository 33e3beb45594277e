#include "response_pipeline.h"
#include "audio_frame_codec.h"
#include "errors.h"
#include "logger.h"
#include "utils.h"
#include <vector>

namespace voxlink {

const char* pipeline_outcome_name(PipelineOutcome outcome) {
    switch (outcome) {
        case PipelineOutcome::Completed: return "completed";
        case PipelineOutcome::Apologized: return "apologized";
        case PipelineOutcome::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

ResponsePipeline::ResponsePipeline(const PipelineServices& services,
                                   const PipelineOptions& options,
                                   OutboundChannel& out,
                                   Generation generation,
                                   CancelTokenPtr cancel)
    : services_(services),
      options_(options),
      out_(out),
      generation_(generation),
      cancel_(cancel ? std::move(cancel) : std::make_shared<CancelToken>()) {}

bool ResponsePipeline::alive() const {
    return !cancel_->is_cancelled() && out_.is_current(generation_);
}

PipelineOutcome ResponsePipeline::run(const std::string& user_text, const FactList& facts) {
    LOG_TRACE(options_.session_id, generation_, "pipeline_start", utils::preview(user_text));

    if (!alive() || !out_.send_control(generation_, UserTranscriptionMsg{user_text})) {
        return PipelineOutcome::Cancelled;
    }

    if (services_.schedule_fact_extraction) {
        services_.schedule_fact_extraction(user_text);
    }

    // tools, tools again (tool-shaped failure only), then no tools
    const std::vector<bool> plan = options_.tools_enabled
        ? std::vector<bool>{true, true, false}
        : std::vector<bool>{false};

    for (size_t i = 0; i < plan.size(); i++) {
        emitted_in_attempt_ = 0;
        attempts_++;
        try {
            AttemptResult result = attempt(user_text, facts, plan[i]);
            if (result == AttemptResult::Stopped || !alive()) {
                LOG_TRACE(options_.session_id, generation_, "pipeline_cancelled", "");
                return PipelineOutcome::Cancelled;
            }
            if (!out_.send_control(generation_, EndOfTurnMsg{})) {
                return PipelineOutcome::Cancelled;
            }
            LOG_TRACE(options_.session_id, generation_, "end_of_turn", "");
            return PipelineOutcome::Completed;
        } catch (const BackendError& e) {
            if (!alive()) return PipelineOutcome::Cancelled;
            LOG_PIPELINE(std::string(error_type_name(e.type())) + " on attempt " +
                         std::to_string(attempts_) + " (tools " + (plan[i] ? "on" : "off") +
                         "): " + e.what());
            if (emitted_in_attempt_ > 0) {
                LOG_PIPELINE("Output already sent for this attempt; not retrying");
                break;
            }
            if (i == 0 && !e.tool_call_shaped()) break;
        } catch (const std::exception& e) {
            if (!alive()) return PipelineOutcome::Cancelled;
            LOG_PIPELINE(std::string("Backend failure on attempt ") + std::to_string(attempts_) +
                         ": " + e.what());
            if (emitted_in_attempt_ > 0 || i == 0) break;
        }
    }

    return apologize();
}

ResponsePipeline::AttemptResult ResponsePipeline::attempt(const std::string& user_text,
                                                          const FactList& facts,
                                                          bool use_tools) {
    SentenceSegmenter segmenter(options_.min_sentence_chars);
    bool stopped = false;

    services_.backend->generate(user_text, facts, use_tools, *cancel_,
        [&](const StreamItem& item) {
            if (!alive()) {
                stopped = true;
                return false;
            }
            if (const auto* fragment = std::get_if<TextFragment>(&item)) {
                for (const auto& sentence : segmenter.feed(fragment->text)) {
                    if (!speak_sentence(sentence)) {
                        stopped = true;
                        return false;
                    }
                }
            } else if (const auto* call = std::get_if<ToolCall>(&item)) {
                auto invocation = services_.extractor->from_structured(*call);
                if (invocation && !run_tool(*invocation)) {
                    stopped = true;
                    return false;
                }
            }
            return true;
        });

    if (stopped || !alive()) return AttemptResult::Stopped;

    std::string rest = segmenter.flush();
    if (!utils::is_empty_or_whitespace(rest) && !speak_sentence(rest)) {
        return AttemptResult::Stopped;
    }
    return AttemptResult::Finished;
}

bool ResponsePipeline::speak_sentence(const std::string& sentence) {
    Extraction extraction = services_.extractor->extract(sentence);
    for (const auto& invocation : extraction.invocations) {
        if (!run_tool(invocation)) return false;
    }

    if (!utils::has_speakable_content(extraction.text)) {
        return alive();
    }
    if (!emit_text(extraction.text)) return false;
    return synthesize(extraction.text);
}

bool ResponsePipeline::run_tool(const ToolInvocation& invocation) {
    if (!alive()) return false;

    ToolResult result;
    try {
        result = services_.tools->execute(invocation);
    } catch (const std::exception& e) {
        result = ToolResult::error_result(std::string("Error: ") + e.what());
    }
    emitted_in_attempt_++;

    if (!result.success) {
        LOG_WARN(make_error(ErrorType::ToolExecution, result.status).to_string());
    }
    LOG_TRACE(options_.session_id, generation_, "tool", invocation.name() + " -> " + result.status);
    return emit_text(tool_marker(invocation, result));
}

bool ResponsePipeline::emit_text(const std::string& text) {
    if (!out_.send_control(generation_, AssistantTextMsg{text})) return false;
    emitted_in_attempt_++;
    LOG_TRACE(options_.session_id, generation_, "assistant_text", utils::preview(text));
    return true;
}

bool ResponsePipeline::synthesize(const std::string& text) {
    if (!services_.synthesizer) return alive();  // text-only turn

    const AudioFrameCodec codec(options_.frame_bytes);
    size_t chunks = 0;
    VoidResult result = services_.synthesizer->synthesize(text, *cancel_,
        [&](const PcmChunk& chunk) {
            for (const auto& frame : codec.split(chunk)) {
                if (!out_.send_audio(generation_, frame)) return false;
                chunks++;
                emitted_in_attempt_++;
            }
            return true;
        });
    if (result.is_error()) {
        // The text already went out; the turn continues without this sentence's audio
        LOG_TTS("Synthesis failed: " + result.error().to_string());
    }
    LOG_TRACE(options_.session_id, generation_, "audio", std::to_string(chunks) + " chunks");
    return alive();
}

PipelineOutcome ResponsePipeline::apologize() {
    LOG_PIPELINE("Giving up on the backend; sending apology");
    if (!emit_text(options_.apology_text)) return PipelineOutcome::Cancelled;
    if (!synthesize(options_.apology_text)) return PipelineOutcome::Cancelled;
    if (!out_.send_control(generation_, EndOfTurnMsg{})) return PipelineOutcome::Cancelled;
    return PipelineOutcome::Apologized;
}

} // namespace voxlink
