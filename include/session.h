#pragma once

#include "common.h"
#include "cancellation.h"
#include "outbound_channel.h"
#include "response_pipeline.h"
#include "state_machine.h"
#include "stt_engine.h"
#include "memory/fact_store.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voxlink {

using RecognizerFactory = std::function<std::unique_ptr<SpeechRecognizer>()>;

/**
 * @brief Everything a Session needs from the server. Shared by all sessions.
 */
struct SessionServices {
    PipelineServices pipeline;
    RecognizerFactory make_recognizer;
    memory::FactStore* facts = nullptr;   ///< Read-only snapshot per turn; may be null
};

struct SessionOptions {
    size_t min_sentence_chars = 3;
    std::string apology_text;
    bool tools_enabled = true;
    size_t frame_bytes = DEFAULT_FRAME_BYTES;
    std::string blank_sentinel = "[BLANK_AUDIO]";
};

/**
 * @brief One WebSocket connection's voice session.
 *
 * Driven by the connection thread through on_text/on_binary/on_disconnect,
 * which never wait for a response. Each utterance's ResponsePipeline runs
 * on its own thread; a new start cancels the running one and advances the
 * generation so its remaining output is dropped.
 */
class Session {
public:
    Session(uint64_t id,
            std::shared_ptr<MessageSink> sink,
            const SessionServices& services,
            const SessionOptions& options);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Text frame from the client (control message)
    void on_text(const std::string& text);

    /// Binary frame from the client (PCM)
    void on_binary(const std::string& data);

    /**
     * @brief Connection is gone: cancel, close the gate, join all pipelines.
     *
     * Idempotent; also run by the destructor.
     */
    void on_disconnect();

    /**
     * @brief Join every pipeline thread started so far
     */
    void drain();

    uint64_t id() const { return id_; }
    SessionState state() const { return state_.get_state(); }
    Generation generation() const { return out_.current(); }

    /// Binary frames fed to the recognizer for the current utterance
    size_t frames_received() const { return frames_received_.load(); }

    /// Outbound messages dropped as stale
    size_t dropped_messages() const { return out_.dropped_count(); }

private:
    struct PipelineTask {
        Generation generation = 0;
        CancelTokenPtr cancel;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    void handle_start();
    void handle_end();
    void spawn_pipeline(const std::string& user_text, Generation generation);
    void cancel_running();
    void reap_finished();

    uint64_t id_;
    SessionServices services_;
    SessionOptions options_;
    OutboundChannel out_;
    StateMachine state_;
    std::unique_ptr<SpeechRecognizer> recognizer_;
    std::atomic<size_t> frames_received_{0};

    std::mutex tasks_mutex_;
    std::vector<PipelineTask> tasks_;
    bool disconnected_ = false;
};

} // namespace voxlink
